#pragma once

#include "address.hpp"
#include "chain_config.hpp"
#include "logs.hpp"
#include "resolver.hpp"
