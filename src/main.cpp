#include "ancillary_resolver.hpp"

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::filesystem::create_directories(logs_path);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::string log_name = avr::utils::currentTimestamp() + "-AncillaryResolver.log";
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logs_path / log_name).string(), true);

    // set different log levels per sink
    console_sink->set_level(spdlog::level::info);
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    spdlog::logger logger("multi_sink", {console_sink, file_sink});
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));
}

static std::string _usage(const avr::cmd::ArgParser & arg_parser)
{
    return std::format("Usage: ancillary-resolver [options] <ancillary data>\n\n{}", arg_parser.constructHelpMessage());
}

int main(int argc, char* argv[])
{
    avr::config::Config cfg;
    cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    cfg.logs_path = cfg.bin_path.parent_path() / "logs";

    const bool terminal_configured = avr::native::configureTerminal();
    _configureLogger(cfg.logs_path);

    if(!terminal_configured)
    {
        spdlog::warn("Terminal configuration was not fully applied");
    }
    else
    {
        spdlog::debug("Terminal configuration applied successfully");
    }

    spdlog::debug("Version: {}.{}.{}", avr::MAJOR_VERSION, avr::MINOR_VERSION, avr::PATCH_VERSION);

    spdlog::debug("Ancillary resolver started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    avr::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", avr::cmd::CommandLineArgDef::NArgs::Zero, avr::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", avr::cmd::CommandLineArgDef::NArgs::Zero, avr::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", avr::cmd::CommandLineArgDef::NArgs::Zero, avr::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--chains", avr::cmd::CommandLineArgDef::NArgs::One, avr::cmd::CommandLineArgDef::Type::String, "JSON file with child chain RPC endpoints");
    arg_parser.addArg("--lookback", avr::cmd::CommandLineArgDef::NArgs::One, avr::cmd::CommandLineArgDef::Type::Int, "Blocks searched before the referenced child block");
    arg_parser.addArg("--lookahead", avr::cmd::CommandLineArgDef::NArgs::One, avr::cmd::CommandLineArgDef::Type::Int, "Blocks searched after the referenced child block");
    arg_parser.addArg("--hex", avr::cmd::CommandLineArgDef::NArgs::Zero, avr::cmd::CommandLineArgDef::Type::Bool, "Treat the input as 0x-prefixed ancillary bytes");
    arg_parser.addArg("--identifier", avr::cmd::CommandLineArgDef::NArgs::One, avr::cmd::CommandLineArgDef::Type::String, "bytes32 price identifier, lists the vote options");
    arg_parser.addArg("--governance", avr::cmd::CommandLineArgDef::NArgs::Zero, avr::cmd::CommandLineArgDef::Type::Bool, "The request is a governance vote");

    const auto parse_res = arg_parser.parse(argc, argv);
    if(!parse_res)
    {
        spdlog::error("{}: {}", std::format("{}", parse_res.error().kind), parse_res.error().message);
        spdlog::info(_usage(arg_parser));
        return 1;
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("Version: {}.{}.{}", avr::MAJOR_VERSION, avr::MINOR_VERSION, avr::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        spdlog::info(_usage(arg_parser));
        return 0;
    }

    if(arg_parser.positional().size() != 1)
    {
        spdlog::error("Expected exactly one ancillary data argument, got {}", arg_parser.positional().size());
        spdlog::info(_usage(arg_parser));
        return 1;
    }

    avr::chain::ChainTable chains = avr::chain::defaultChainTable();
    if(const auto chains_arg = arg_parser.getArg<std::vector<std::string>>("--chains"))
    {
        cfg.chains_path = chains_arg->at(0);
        const auto loaded = avr::chain::loadChainTable(cfg.chains_path);
        if(!loaded)
        {
            spdlog::error("Failed to load chain table {}: {} ({})",
                cfg.chains_path.string(), loaded.error().message, std::format("{}", loaded.error().kind));
            return 1;
        }
        chains = avr::chain::mergeChainTables(std::move(chains), *loaded);
        spdlog::debug("Loaded {} chains from {}", loaded->size(), cfg.chains_path.string());
    }

    const std::string & input = arg_parser.positional().front();
    const std::string ancillary_text = arg_parser.getArg<bool>("--hex").value_or(false)
        ? avr::vote::decodeAncillaryData(input)
        : input;

    avr::chain::ResolverOptions resolver_options;
    if(const auto lookback_arg = arg_parser.getArg<std::vector<int>>("--lookback"))
    {
        if(lookback_arg->at(0) < 0)
        {
            spdlog::error("--lookback must not be negative");
            return 1;
        }
        resolver_options.lookback_blocks = static_cast<std::uint64_t>(lookback_arg->at(0));
    }
    if(const auto lookahead_arg = arg_parser.getArg<std::vector<int>>("--lookahead"))
    {
        if(lookahead_arg->at(0) < 0)
        {
            spdlog::error("--lookahead must not be negative");
            return 1;
        }
        resolver_options.lookahead_blocks = static_cast<std::uint64_t>(lookahead_arg->at(0));
    }

    const avr::chain::CrossChainResolver resolver(std::move(chains), {}, std::move(resolver_options));

    asio::io_context io_context;

    int exit_code = 0;
    asio::co_spawn(io_context, avr::parse::extractDescription(ancillary_text, resolver),
        [&exit_code](std::exception_ptr ex, std::string description)
        {
            if(ex)
            {
                try
                {
                    std::rethrow_exception(ex);
                }
                catch(const std::exception & e)
                {
                    spdlog::error("Description extraction failed: {}", e.what());
                }
                exit_code = 1;
                return;
            }

            std::printf("%s\n", description.c_str());
            std::fflush(stdout);
        });

    try
    {
        io_context.run();
    }catch(std::exception & e)
    {
        spdlog::error("Error: {}", e.what());
        exit_code = 1;
    }

    if(exit_code == 0)
    {
        if(const auto identifier_arg = arg_parser.getArg<std::vector<std::string>>("--identifier"))
        {
            const std::string identifier = avr::vote::decodeIdentifier(identifier_arg->at(0));
            const bool is_governance = arg_parser.getArg<bool>("--governance").value_or(false);

            std::printf("Identifier: %s\n", identifier.c_str());
            for(const avr::vote::VoteOption & option : avr::vote::getVoteOptions(identifier, is_governance, ancillary_text))
            {
                std::printf("  %s: %s\n", option.label.c_str(), option.display_value.c_str());
            }
            std::fflush(stdout);
        }
    }

    spdlog::debug("Program finished");
    return exit_code;
}
