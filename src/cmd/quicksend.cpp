/**
 * @file quicksend.cpp
 * @brief Command-line front end: receive (no destination) or send (destination + files)
 *
 * Usage:
 *   quicksend [-s] [-n] [-p PORT] [-o DIR]            receive one session
 *   quicksend [-p PORT] <IP|auto> FILE_OR_DIR...      send files
 *
 * Example:
 *   quicksend -s                      (on the receiving machine)
 *   quicksend auto ~/photos notes.txt (on the sending machine)
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/Commands.h"
#include "quicksend/Debug.h"
#include "quicksend/ThreadSafeLog.h"
#include "quicksend/config.h"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace QuickSend;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    bool stripPrefix = false;
    bool noBroadcast = false;
    bool verbose = false;
    bool help = false;
    bool portGiven = false;
    uint16_t port = 0;
    std::string outputDir = ".";
    std::string configPath;
    std::vector<std::string> positional;
};

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " [options]                     receive files\n";
    std::cout << "  " << programName << " [options] <IP|auto> FILES...  send files\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -s, --strip-prefix   Receiver: drop the path prefix shared by all files\n";
    std::cout << "  -n, --no-broadcast   Receiver: do not announce this host via UDP\n";
    std::cout << "  -p, --port PORT      TCP port to listen on / connect to (default "
              << TRANSFER_PORT << ")\n";
    std::cout << "  -o, --output DIR     Receiver: directory for relative paths (default .)\n";
    std::cout << "  -c, --config FILE    Settings file (default ~/.config/quicksend/config.json)\n";
    std::cout << "  -v, --verbose        Debug output\n";
    std::cout << "  -h, --help           Show this help\n";
    std::cout << "\nDirectories are sent recursively. Paths are sent exactly as given;\n";
    std::cout << "the receiver writes them as-is (absolute paths stay absolute).\n";
    std::cout << "No encryption, no authentication: use on trusted networks only.\n";
}

/**
 * @brief Format bytes to human-readable string
 */
std::string formatBytes(uint64_t bytes) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    if (bytes >= GB) {
        oss << std::fixed << std::setprecision(2) << (bytes / GB) << " GB";
    } else if (bytes >= MB) {
        oss << std::fixed << std::setprecision(2) << (bytes / MB) << " MB";
    } else if (bytes >= KB) {
        oss << std::fixed << std::setprecision(2) << (bytes / KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Format speed to human-readable string
 */
std::string formatSpeed(double bytesPerSecond) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytesPerSecond >= GB) {
        oss << (bytesPerSecond / GB) << " GB/s";
    } else if (bytesPerSecond >= MB) {
        oss << (bytesPerSecond / MB) << " MB/s";
    } else if (bytesPerSecond >= KB) {
        oss << (bytesPerSecond / KB) << " KB/s";
    } else {
        oss << bytesPerSecond << " bytes/s";
    }
    return oss.str();
}

bool parsePort(const std::string& text, uint16_t& port) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/**
 * @brief Parse argv; options may appear anywhere, "--" ends option parsing
 */
bool parseCommandLine(int argc, char* argv[], CommandLine& cmd, std::string& errorMsg) {
    bool optionsEnded = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (optionsEnded || arg.empty() || arg[0] != '-' || arg == "-") {
            cmd.positional.push_back(arg);
            continue;
        }

        auto needValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                errorMsg = "Option " + arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--") {
            optionsEnded = true;
        } else if (arg == "-s" || arg == "--strip-prefix") {
            cmd.stripPrefix = true;
        } else if (arg == "-n" || arg == "--no-broadcast") {
            cmd.noBroadcast = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "-p" || arg == "--port") {
            std::string value;
            if (!needValue(value)) {
                return false;
            }
            if (!parsePort(value, cmd.port)) {
                errorMsg = "Invalid port number: " + value;
                return false;
            }
            cmd.portGiven = true;
        } else if (arg == "-o" || arg == "--output") {
            if (!needValue(cmd.outputDir)) {
                return false;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (!needValue(cmd.configPath)) {
                return false;
            }
        } else {
            errorMsg = "Unknown option: " + arg;
            return false;
        }
    }

    return true;
}

/**
 * @brief Expand directories into their regular files, sorted, keeping argument order
 */
bool expandInputs(const std::vector<std::string>& inputs, std::vector<std::string>& files,
                  TransferError& error)
{
    for (const auto& input : inputs) {
        std::error_code ec;
        if (!std::filesystem::is_directory(input, ec)) {
            // Files (and missing paths) go through as-is; pre-flight reports errors
            files.push_back(input);
            continue;
        }

        std::vector<std::string> found;
        std::filesystem::recursive_directory_iterator it(input, ec);
        if (ec) {
            error.set(ErrorKind::LOCAL_IO, "Cannot read directory " + input + ": " + ec.message());
            return false;
        }
        for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                error.set(ErrorKind::LOCAL_IO, "Cannot walk directory " + input + ": " + ec.message());
                return false;
            }
            if (it->is_regular_file(ec)) {
                found.push_back(it->path().string());
            }
        }
        if (ec) {
            error.set(ErrorKind::LOCAL_IO, "Cannot walk directory " + input + ": " + ec.message());
            return false;
        }

        std::sort(found.begin(), found.end());
        files.insert(files.end(), found.begin(), found.end());
    }
    return true;
}

void printSummary(const char* verb, const TransferStats& stats) {
    std::cout << verb << " " << stats.filesCompleted << " file(s), "
              << formatBytes(stats.bytesTransferred) << " in "
              << std::fixed << std::setprecision(2) << stats.elapsedSeconds << " s ("
              << formatSpeed(stats.bytesPerSecond()) << ")\n";
}

int fail(const TransferError& error) {
    std::cerr << "FATAL [" << error.code() << "]: " << error.message << "\n";
    return EXIT_ERROR;
}

int runReceiver(const CommandLine& cmd, const Settings& settings) {
    ReceiverOptions options;
    options.port = cmd.portGiven ? cmd.port : settings.transferPort;
    options.stripPrefix = cmd.stripPrefix;
    options.broadcast = !cmd.noBroadcast;
    options.outputDir = cmd.outputDir;
    options.settings = settings;

    TransferStats stats;
    TransferError error;
    if (!startReceiver(options, stats, error)) {
        if (stats.filesCompleted > 0) {
            std::cerr << stats.filesCompleted << " file(s) were written before the failure\n";
        }
        return fail(error);
    }

    printSummary("Received", stats);
    return EXIT_OK;
}

int runSender(const CommandLine& cmd, const Settings& settings) {
    const std::string& destination = cmd.positional.front();
    const std::vector<std::string> inputs(cmd.positional.begin() + 1, cmd.positional.end());

    TransferError error;
    std::vector<std::string> files;
    if (!expandInputs(inputs, files, error)) {
        return fail(error);
    }
    if (files.empty()) {
        std::cerr << "Nothing to send\n";
        return EXIT_USAGE;
    }

    PeerAddress receiver;
    if (destination == AUTO_ADDRESS) {
        if (!resolveViaDiscovery(settings.discoveryTimeoutMs, settings.discoveryPort,
                                 receiver, error)) {
            return fail(error);
        }
        if (cmd.portGiven) {
            receiver.tcpPort = cmd.port;
        }
    } else {
        receiver = PeerAddress(destination, cmd.portGiven ? cmd.port : settings.transferPort);
    }

    TransferStats stats;
    if (!sendFiles(receiver, files, settings, stats, error)) {
        return fail(error);
    }

    printSummary("Sent", stats);
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    std::string errorMsg;
    if (!parseCommandLine(argc, argv, cmd, errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    if (cmd.help) {
        printUsage(argv[0]);
        return EXIT_OK;
    }

    setVerboseLogging(cmd.verbose);

    const Settings settings = loadSettings(cmd.configPath);
    if (!settings.logFile.empty()) {
        ThreadSafeLog::initialize(settings.logFile);
    }

    if (cmd.positional.empty()) {
        return runReceiver(cmd, settings);
    }

    const std::string& destination = cmd.positional.front();
    if (destination != AUTO_ADDRESS && !isIpLiteral(destination)) {
        std::cerr << "Error: destination must be an IP address or '" << AUTO_ADDRESS
                  << "', got: " << destination << "\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    if (cmd.positional.size() < 2) {
        std::cerr << "Error: no files given\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    return runSender(cmd, settings);
}
