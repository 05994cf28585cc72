// Example usage of the rconpp client
// Runs one command from the arguments, or one command per line from stdin

#include <rcon/client.hpp>
#include <rcon/errors.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace {

bool StdinIsTerminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(fileno(stdin)) != 0;
#endif
}

void PrintUsage(const char* program) {
    std::cout
        << program << " -p password [OPTIONS] command [args]...\n"
        "Runs command with args on an RCON server and prints the response. Use '-' as\n"
        "the command, or redirect stdin, to run one command per line of input.\n\n"
        "  -s  server (default: localhost)\n"
        "  -P  port (default: " << rcon::protocol::DEFAULT_PORT << ")\n"
        "  -p  password (default: $RCON_PASSWORD)\n"
        "  -t  connect timeout in milliseconds (default: " << rcon::protocol::DEFAULT_TIMEOUT_MS << ")\n"
        "  -h  this message\n"
        << std::flush;
}

bool RequireValue(int argc, char* argv[], int i, const char* flag) {
    if (i >= argc) {
        std::cerr << "Error: option " << flag << " requires an argument." << std::endl;
        PrintUsage(argv[0]);
        return false;
    }
    return true;
}

bool ParseNumber(const char* text, unsigned long max, unsigned long& out) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > max) {
        return false;
    }
    out = value;
    return true;
}

int RunCommand(rcon::Client& client, const std::string& command) {
    try {
        std::string body = client.Command(command);
        if (body.empty() || body.back() != '\n') {
            std::cout << body << std::endl;
        } else {
            std::cout << body << std::flush;
        }
    } catch (const rcon::Error& e) {
        std::cerr << "Error " << e.GetCode() << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    rcon::ClientConfig config;
    config.address = "localhost";

    std::string password;
    if (const char* env = std::getenv("RCON_PASSWORD")) {
        password = env;
    }

    bool read_from_stdin = false;
    int i = 1;
    while (i < argc && argv[i][0] == '-') {
        unsigned long number = 0;
        if (std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return EXIT_SUCCESS;
        } else if (std::strcmp(argv[i], "-") == 0) {
            read_from_stdin = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            if (!RequireValue(argc, argv, ++i, "-s")) return EXIT_FAILURE;
            config.address = argv[i];
        } else if (std::strcmp(argv[i], "-P") == 0) {
            if (!RequireValue(argc, argv, ++i, "-P")) return EXIT_FAILURE;
            if (!ParseNumber(argv[i], 65535, number)) {
                std::cerr << "Error: invalid port '" << argv[i] << "'" << std::endl;
                return EXIT_FAILURE;
            }
            config.port = static_cast<uint16_t>(number);
        } else if (std::strcmp(argv[i], "-p") == 0) {
            if (!RequireValue(argc, argv, ++i, "-p")) return EXIT_FAILURE;
            password = argv[i];
        } else if (std::strcmp(argv[i], "-t") == 0) {
            if (!RequireValue(argc, argv, ++i, "-t")) return EXIT_FAILURE;
            if (!ParseNumber(argv[i], UINT32_MAX, number)) {
                std::cerr << "Error: invalid timeout '" << argv[i] << "'" << std::endl;
                return EXIT_FAILURE;
            }
            config.connect_timeout_ms = static_cast<uint32_t>(number);
        } else {
            std::cerr << "Error: unknown option " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return EXIT_FAILURE;
        }
        ++i;
    }

    read_from_stdin = read_from_stdin || !StdinIsTerminal();

    if (password.empty()) {
        std::cerr << "Error: no password given." << std::endl;
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (i >= argc && !read_from_stdin) {
        std::cerr << "Error: no command given." << std::endl;
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string target = config.address + ":" + std::to_string(config.port);
    rcon::Client client(config);

    try {
        client.Connect(password);
    } catch (const rcon::AuthenticationFailedError&) {
        std::cerr << "Authentication to " << target << " failed: wrong password" << std::endl;
        return EXIT_FAILURE;
    } catch (const rcon::Error& e) {
        std::cerr << "Connection to " << target << " failed (" << e.GetCode() << "): "
                  << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int status = EXIT_SUCCESS;
    if (i < argc) {
        std::string command = argv[i++];
        while (i < argc) {
            command += " ";
            command += argv[i++];
        }
        status = RunCommand(client, command);
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            std::cout << target << " > " << line << std::endl;
            status = RunCommand(client, line);
            if (status != EXIT_SUCCESS) {
                break;
            }
        }
    }

    try {
        client.Close();
    } catch (const rcon::Error& e) {
        std::cerr << "Error closing connection: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return status;
}
