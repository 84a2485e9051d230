#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <cerrno>
#include <atomic>
#include <memory>
#include <sys/socket.h>
#include <sys/select.h>
#include <sys/un.h>
#include <unistd.h>

#include "CommandHandler.hpp"
#include "ConfigLoader.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "MiniaudioEngine.hpp"
#include "MusicManager.hpp"

#define JUKEBOX_SOCKET_PATH "/tmp/jukebox.sock"

using namespace Jukebox;

std::atomic<bool> g_running{true};

// --- CLIENT MODE (sends a single command to the daemon) ---
int runClientMode(const std::string& socketPath, const std::string& message) {
    int sock = socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock < 0) {
        std::cerr << "Socket creation error: " << strerror(errno) << std::endl;
        return 1;
    }

    struct sockaddr_un serv_addr;
    memset(&serv_addr, 0, sizeof(serv_addr));
    serv_addr.sun_family = AF_UNIX;
    strncpy(serv_addr.sun_path, socketPath.c_str(), sizeof(serv_addr.sun_path) - 1);

    if (connect(sock, (struct sockaddr*)&serv_addr, sizeof(serv_addr)) < 0) {
        std::cerr << "Connection Failed. Is the daemon running? (Run: jukeboxd --daemon <config>)" << std::endl;
        close(sock);
        return 1;
    }

    if (send(sock, message.c_str(), message.length(), 0) < 0) {
        std::cerr << "Send failed: " << strerror(errno) << std::endl;
        close(sock);
        return 1;
    }

    char buffer[4096];
    ssize_t valread;
    while ((valread = read(sock, buffer, sizeof(buffer))) > 0) {
        std::cout.write(buffer, valread);
    }
    close(sock);
    return 0;
}

// --- DAEMON MODE ---
void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int runSocketServer(const std::string& socketPath, CommandHandler& handler) {
    int server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd < 0) {
        Log::error(std::string("[Daemon] socket failed: ") + strerror(errno));
        return 1;
    }

    struct sockaddr_un address;
    memset(&address, 0, sizeof(address));
    address.sun_family = AF_UNIX;
    strncpy(address.sun_path, socketPath.c_str(), sizeof(address.sun_path) - 1);
    unlink(socketPath.c_str());

    if (bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Log::error(std::string("[Daemon] bind failed: ") + strerror(errno));
        close(server_fd);
        return 1;
    }

    if (listen(server_fd, 5) < 0) {
        Log::error(std::string("[Daemon] listen failed: ") + strerror(errno));
        close(server_fd);
        return 1;
    }

    Log::info("[Daemon] Listening on " + socketPath);

    while (g_running) {
        fd_set readfds;
        struct timeval tv;

        FD_ZERO(&readfds);
        FD_SET(server_fd, &readfds);

        tv.tv_sec = 0;
        tv.tv_usec = 500000; // 500ms

        int activity = select(server_fd + 1, &readfds, NULL, NULL, &tv);
        if (activity < 0) {
            if (errno == EINTR) continue;
            Log::error(std::string("[Daemon] select failed: ") + strerror(errno));
            break;
        }

        if (activity > 0 && FD_ISSET(server_fd, &readfds)) {
            int client_fd = accept(server_fd, NULL, NULL);
            if (client_fd < 0) {
                continue;
            }

            char buffer[1024] = {0};
            ssize_t valread = read(client_fd, buffer, sizeof(buffer) - 1);
            if (valread > 0) {
                std::string msg(buffer, valread);
                while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();

                std::string response;
                if (msg == "quit") {
                    g_running = false;
                    response = "OK: Shutting down\n";
                } else {
                    response = handler.handle(msg);
                }

                if (send(client_fd, response.c_str(), response.length(), 0) < 0) {
                    Log::warn(std::string("[Daemon] Reply failed: ") + strerror(errno));
                }
            }
            close(client_fd);
        }
    }

    close(server_fd);
    unlink(socketPath.c_str());
    return 0;
}

int runDaemonMode(const std::string& configPath) {
    nlohmann::json config;
    try {
        config = ConfigLoader::loadFile(configPath);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::string socketPath = JUKEBOX_SOCKET_PATH;
    double fadeSeconds = CommandHandler::kDefaultFadeSeconds;
    if (config.is_object()) {
        if (config.contains("log_level") && config["log_level"].is_string()) {
            if (!Log::setLevelFromString(config["log_level"].get<std::string>())) {
                Log::warn("[Daemon] Unknown log_level, keeping " + std::string(Log::label(Log::level())));
            }
        }
        if (config.contains("socket") && config["socket"].is_string()) {
            socketPath = config["socket"].get<std::string>();
        }
        if (config.contains("volume_fade_seconds") && config["volume_fade_seconds"].is_number()) {
            fadeSeconds = config["volume_fade_seconds"].get<double>();
        }
    }

    std::unique_ptr<MusicManager> manager;
    try {
        manager = std::make_unique<MusicManager>(config, std::make_shared<MiniaudioEngine>());
    } catch (const ConfigError& e) {
        Log::error("[Daemon] Invalid configuration in " + configPath + ": " + e.what());
        return 1;
    }

    Log::info("[Daemon] Loaded " + std::to_string(manager->groups().size()) + " music groups, volume "
              + std::to_string(manager->volume()));

    CommandHandler handler(*manager, fadeSeconds);
    int rc = runSocketServer(socketPath, handler);

    manager->cancel();
    Log::info("[Daemon] Shutting down");
    return rc;
}

void showUsage() {
    std::cout << "Usage:\n";
    std::cout << "  jukeboxd --daemon <config.json>   Start the daemon\n";
    std::cout << "  jukeboxd play <group> <list>      Play a track list\n";
    std::cout << "  jukeboxd stop                     Stop playback\n";
    std::cout << "  jukeboxd volume <0-100> [instant] Change the volume (short fade unless instant)\n";
    std::cout << "  jukeboxd status                   Get status\n";
    std::cout << "  jukeboxd list                     List groups and track lists\n";
    std::cout << "  jukeboxd quit                     Stop the daemon\n";
    std::cout << "Set JUKEBOX_SOCKET to use another socket path in client mode.\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        showUsage();
        return 0;
    }

    std::string arg1 = argv[1];

    if (arg1 == "--daemon") {
        if (argc < 3) {
            std::cout << "Error: --daemon requires a config file.\n";
            return 1;
        }
        return runDaemonMode(argv[2]);
    }

    if (arg1 == "play" || arg1 == "stop" || arg1 == "volume" || arg1 == "status"
        || arg1 == "list" || arg1 == "quit") {
        std::string message = arg1;
        for (int i = 2; i < argc; i++) {
            message += " ";
            message += argv[i];
        }
        const char* envSocket = std::getenv("JUKEBOX_SOCKET");
        return runClientMode(envSocket ? envSocket : JUKEBOX_SOCKET_PATH, message);
    }

    showUsage();
    return 0;
}
