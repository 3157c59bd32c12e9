#include <boost/filesystem.hpp>
#include <cstring>
#include <trainlog/io/serialize.hpp>
#include <trainlog/session/session.hpp>
#include <trainlog/util/protobuf.hpp>

namespace trainlog {
namespace {

struct Options {
    std::string command;
    std::string input;
    std::string output;
    std::string format;
};

void print_usage(const char* program) {
    std::cout << "Usage: "
              << boost::filesystem::path(program).filename().string()
              << " COMMAND INPUT [OPTIONS]\n"
              << "Commands:\n"
              << "  parse INPUT [--format text|json]\n"
              << "  export INPUT [-o OUTPUT]\n"
              << "  batch INPUT [-o OUTPUT] [--format tsv|json]\n"
              << "Environment Variables:\n"
              << "  TRAINLOG_LOG_FILE = " << DEFAULT_LOG_FILE << "\n"
              << "  TRAINLOG_LOG_LEVEL = " << DEFAULT_LOG_LEVEL << "\n"
              << "  TRAINLOG_ON_ERROR = " << DEFAULT_ON_ERROR << "\n"
              << "  TRAINLOG_SYNONYMS = (unset)\n";
}

bool parse_options(int argc, char** argv, Options& options) {
    if (argc < 3) return false;
    options.command = argv[1];
    options.input = argv[2];
    if (options.command == "parse") {
        options.format = "text";
    } else if (options.command == "batch") {
        options.format = "tsv";
    } else if (options.command == "export") {
        options.format = "json";
    } else {
        return false;
    }

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 == argc) return false;
        if (arg == "-o" or arg == "--output") {
            if (options.command == "parse") return false;
            options.output = argv[++i];
        } else if (arg == "--format") {
            if (options.command == "export") return false;
            options.format = argv[++i];
        } else {
            return false;
        }
    }

    if (options.command == "parse") {
        return options.format == "text" or options.format == "json";
    }
    if (options.command == "batch") {
        return options.format == "tsv" or options.format == "json";
    }
    return true;
}

void report_failures(const ParsedSession& session) {
    for (const auto& failure : session.failures) {
        std::cerr << "skipped line " << failure.line_number << ": "
                  << failure.text << "\n  " << failure.message << std::endl;
    }
}

void write_output(const std::string& filename, const std::string& text) {
    if (filename.empty()) {
        std::cout << text;
        return;
    }
    std::ofstream file(filename, std::ios::trunc);
    TRAINLOG_ASSERT(file, "failed to open file " << filename);
    file << text;
    TRAINLOG_ASSERT(file, "failed to write to " << filename);
    TRAINLOG_INFO("wrote " << filename);
}

int run(const Options& options, const NameStandardizer& standardizer) {
    TRAINLOG_PRINT(options.command);
    TRAINLOG_PRINT(options.format);
    const Timer timer;
    const SessionParser parser(standardizer, error_policy_from_env());
    const auto lines = read_lines(options.input);

    if (options.command == "parse" or options.command == "export") {
        const ParsedSession session =
            parser.parse(filter_single_session(lines));
        report_failures(session);
        TRAINLOG_INFO("parsed " << session.exercises.size() << " exercises in "
                                << timer.elapsed() << " sec");
        if (options.format == "text") {
            std::ostringstream text;
            for (const auto& exercise : session.exercises) {
                text << exercise << "\n";
            }
            write_output(options.output, text.str());
        } else {
            protobuf::Workout message;
            dump(session, message);
            write_output(options.output, protobuf::to_json(message));
        }
        return 0;
    }

    std::vector<ParsedSession> sessions;
    for (const auto& raw : group_sessions(lines)) {
        sessions.push_back(parser.parse(raw));
        report_failures(sessions.back());
    }
    TRAINLOG_INFO("parsed " << sessions.size() << " sessions in "
                            << timer.elapsed() << " sec");
    if (options.format == "tsv") {
        std::ostringstream text;
        write_tsv_header(text);
        for (const auto& session : sessions) {
            write_tsv_rows(text, session);
        }
        write_output(options.output, text.str());
    } else {
        protobuf::Export message;
        dump(sessions, utc_timestamp(), message);
        write_output(options.output, protobuf::to_json(message));
    }
    return 0;
}

}  // namespace
}  // namespace trainlog

int main(int argc, char** argv) {
    trainlog::Log::Context log_context(argc, argv);

    trainlog::Options options;
    if (not trainlog::parse_options(argc, argv, options)) {
        trainlog::print_usage(argv[0]);
        TRAINLOG_WARN("incorrect program args");
        exit(1);
    }

    if (not boost::filesystem::exists(options.input)) {
        std::cerr << "input file not found: " << options.input << std::endl;
        TRAINLOG_WARN("missing input " << options.input);
        exit(1);
    }

    trainlog::NameStandardizer standardizer;
    standardizer.extend(trainlog::load_synonyms_from_env());

    try {
        return trainlog::run(options, standardizer);
    } catch (const trainlog::LineError& error) {
        std::cerr << "aborted: " << error.what() << std::endl;
        return 1;
    }
}
