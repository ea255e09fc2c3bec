#include "jt808_codec/buffer.hpp"
#include "jt808_codec/config.hpp"
#include "jt808_codec/parser.hpp"
#include "jt808_codec/validator.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    try {
        // Set up command line options
        po::options_description desc("JT808 frame decoder options");
        desc.add_options()
            ("help,h", "Print help message")
            ("hex,x", po::value<std::string>(), "Frame as hex string, delimiters included")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("validate,v", po::bool_switch()->default_value(false), "Validate the decoded body")
            ("debug,d", po::bool_switch()->default_value(false), "Enable debug logging");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        // Check for help
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        if (!vm.count("hex")) {
            std::cerr << "Missing --hex frame" << std::endl << desc << std::endl;
            return 1;
        }

        spdlog::set_level(vm["debug"].as<bool>() ? spdlog::level::debug : spdlog::level::warn);

        jt808_codec::Parser::Config parserConfig;
        jt808_codec::Validator::Config validatorConfig;
        if (vm.count("config")) {
            const auto& path = vm["config"].as<std::string>();
            parserConfig = jt808_codec::Config::loadParserConfig(path);
            validatorConfig = jt808_codec::Config::loadValidatorConfig(path);
        }

        jt808_codec::Bytes frame;
        if (!jt808_codec::fromHex(vm["hex"].as<std::string>(), frame)) {
            std::cerr << "Error: --hex is not a valid hex string" << std::endl;
            return 1;
        }

        jt808_codec::Parser parser(parserConfig);
        jt808_codec::ParsedMessage message = parser.parse(frame);
        nlohmann::json output = message.toJson();

        bool ok = message.isSuccess();
        if (ok && vm["validate"].as<bool>() && message.isDecoded()) {
            jt808_codec::Validator validator(validatorConfig);
            auto result = validator.validate(message.getMessageId(), message.getFields());
            output["validation"] = {
                {"valid", result.success},
                {"error", jt808_codec::errorToString(result.errorCode)},
                {"message", result.errorMessage}
            };
            ok = result.success;
        }

        std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return ok ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
