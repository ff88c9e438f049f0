#include "sgylib/SegyReader.hpp"
#include "sgylib/TraceMap.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    const std::string MapName = "cdp_map";
    const std::vector<std::string> MapKeys = {"CDP_X", "CDP_Y"};
    const std::vector<std::string> ShownFields = {"TraceSequenceLine", "TraceNumber", "TraceSamples",
                                                  "TraceSampleInterval", "CDP_X", "CDP_Y"};

    struct Args {
        std::string file;
        std::optional<int> trace;
        std::string key;
        std::optional<int> value;
    };

    int parse_int(const std::string& option, const std::string& text) {
        const std::string message = "Bad value for " + option + ": " + text;
        std::size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(text, &used);
        } catch (const std::logic_error&) {
            throw std::invalid_argument(message);
        }
        if (used != text.size()) throw std::invalid_argument(message);
        return v;
    }

    Args parse_args(int argc, char** argv) {
        Args args;
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("Missing value after " + a);
                return argv[++i];
            };
            if (a == "--trace") {
                args.trace = parse_int(a, next());
            } else if (a == "--key") {
                args.key = next();
            } else if (a == "--value") {
                args.value = parse_int(a, next());
            } else if (args.file.empty()) {
                args.file = a;
            } else {
                throw std::invalid_argument("Unexpected argument: " + a);
            }
        }
        if (args.file.empty()) throw std::invalid_argument("No SEG-Y file given");
        if (args.key.empty() != !args.value.has_value()) {
            throw std::invalid_argument("--key and --value must be given together");
        }
        return args;
    }

    void print_summary(const SegyReader& reader) {
        for (const auto& line : reader.text_header_lines()) {
            if (line.size() > 4) std::cout << line << "\n";
        }
        std::cout << "\nTraces:          " << reader.num_traces()
                  << "\nSamples/trace:   " << reader.num_samples()
                  << "\nSample interval: " << reader.sample_interval() << " us"
                  << "\nSample format:   " << reader.sample_format()
                  << "\nSEG-Y revision:  0x" << std::hex << reader.get_bin_header_value("SEGYRevision") << std::dec
                  << "\n";
    }

    void print_trace(const SegyReader& reader, int index) {
        std::cout << "\nTrace " << index << ":";
        for (const auto& field : ShownFields) {
            std::cout << " " << field << "=" << reader.get_header_value_i32(index, field);
        }
        std::cout << "\n ";
        for (int16_t s : reader.get_trace(index)) std::cout << " " << s;
        std::cout << "\n";
    }

    void ensure_index(SegyReader& reader, const std::string& file) {
        const std::string db_path = file + ".cdp.sqlite";
        if (!std::filesystem::exists(db_path)) {
            std::cout << "Trace index not found. Building new one..." << std::endl;
            reader.build_tracemap(MapName, db_path, MapKeys);
        } else {
            reader.load_tracemap(MapName, db_path, MapKeys);
        }
    }
}

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\nUsage: " << argv[0]
                  << " <file.sgy> [--trace N] [--key CDP_X|CDP_Y --value V]\n";
        return 1;
    }

    try {
        SegyReader reader(args.file);
        print_summary(reader);

        if (args.trace) {
            print_trace(reader, *args.trace);
        }

        if (!args.key.empty()) {
            ensure_index(reader, args.file);
            auto tmap = reader.get_tracemap(MapName);
            std::vector<std::optional<int>> filter(MapKeys.size());
            bool known = false;
            for (std::size_t k = 0; k < MapKeys.size(); ++k) {
                if (MapKeys[k] == args.key) {
                    filter[k] = args.value;
                    known = true;
                }
            }
            if (!known) throw std::invalid_argument("Key must be CDP_X or CDP_Y, got " + args.key);

            auto indices = tmap->find_trace_indices(filter);
            std::cout << "\n" << indices.size() << " trace(s) with " << args.key << " = " << *args.value << "\n";
            for (int i : indices) print_trace(reader, i);
        }
    } catch (const std::exception& e) {
        log_error(e.what());
        return 2;
    }
    return 0;
}
