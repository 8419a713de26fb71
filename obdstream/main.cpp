#include "src/pid_registry.hpp"
#include "src/stream_parser.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [-v] [--dbc FILE] [--chunk N] CAPTURE [OUTPUT]\n"
              << "  CAPTURE  raw adapter transcript, '-' for stdin\n"
              << "  OUTPUT   decoded readings (default stdout)\n";
}

int main(int argc, char** argv) {
    bool verbose = false;
    std::string dbc_path;
    size_t chunk = 64;
    std::string capture_path;
    std::string output_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v") {
            verbose = true;
        } else if (arg == "--dbc" && i + 1 < argc) {
            dbc_path = argv[++i];
        } else if (arg == "--chunk" && i + 1 < argc) {
            try {
                chunk = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                chunk = 0;
            }
            if (chunk == 0) {
                std::cerr << "--chunk needs a positive size\n";
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (capture_path.empty()) {
            capture_path = arg;
        } else if (output_path.empty()) {
            output_path = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (capture_path.empty()) {
        usage(argv[0]);
        return 1;
    }

    obd::PidRegistry registry;
    std::string err;
    if (dbc_path.empty()) {
        if (!obd::load_default_registry(registry, &err)) {
            std::cerr << "Could not load PID definitions: " << err << "\n";
            return 1;
        }
    } else {
        std::shared_ptr<const dbcppp::INetwork> net = obd::load_network(dbc_path);
        if (!net) {
            std::cerr << "DBC " << dbc_path << " failed to load. Exiting.\n";
            return 1;
        }
        if (!obd::load_registry(std::move(net), registry, &err)) {
            std::cerr << "DBC " << dbc_path << ": " << err << "\n";
            return 1;
        }
    }

    std::string capture;
    if (capture_path == "-") {
        capture.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(capture_path, std::ios::binary);
        if (!in) {
            std::cerr << "Could not open " << capture_path << "\n";
            return 1;
        }
        capture.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::ofstream file_out;
    if (!output_path.empty()) {
        file_out.open(output_path);
        if (!file_out) {
            std::cerr << "Could not create " << output_path << "\n";
            return 1;
        }
    }
    std::ostream& out = output_path.empty() ? std::cout : file_out;

    obd::StreamParser parser(registry);
    if (verbose) {
        parser.set_log(&std::cerr);
        parser.on_ready([&out] { out << ">>\n"; });
    }

    size_t decoded = 0;
    for (size_t pos = 0; pos < capture.size(); pos += chunk) {
        obd::FeedResult fr = parser.feed(capture.substr(pos, chunk));
        for (const auto& r : fr.results) {
            obd::write_result(r, out);
            ++decoded;
        }
    }

    if (!parser.buffer().empty()) {
        std::cerr << "Capture ended inside a response, "
                  << parser.buffer().size() << " byte(s) dropped\n";
        parser.reset();
    }

    std::cerr << "Decoded " << decoded << " line(s)\n";
    return 0;
}
