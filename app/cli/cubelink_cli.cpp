#include <condition_variable>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <json/json.h>
#include "AccessCode.h"
#include "Config.h"
#include "Constants.h"
#include "EventBus.h"
#include "IntegrityVerifier.h"
#include "Logger.h"
#include "MemoryTransport.h"
#include "MetricsCollector.h"
#include "P2PEvents.h"
#include "P2PService.h"
#include "P2PSettings.h"
#include "SignalingCoordinator.h"

using namespace CubeLink;

namespace {

void printUsage(const char* program) {
    std::cout << "CubeLink - encrypted peer-to-peer file transfer" << std::endl;
    std::cout << "\nUsage: " << program << " [OPTIONS] <command> [args]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  ice                      Print the ICE server configuration" << std::endl;
    std::cout << "  hash <file>              Print the SHA-256 of a file" << std::endl;
    std::cout << "  loopback <src> <dst>     Transfer <src> to <dst> between two in-process peers" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <PATH>          Load settings from a key=value file (repeatable;" << std::endl;
    std::cout << "                           later files win). Without it the system and user" << std::endl;
    std::cout << "                           files are read when present" << std::endl;
    std::cout << "  --prometheus             Print counters in Prometheus text format on exit" << std::endl;
    std::cout << "  --verbose                Log to the console" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
}

int runIce(const P2PSettings& settings) {
    EventBus bus;
    SignalingCoordinator signaling(settings, bus);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, signaling.iceServers()) << std::endl;
    return 0;
}

int runHash(const std::string& path) {
    auto digest = IntegrityVerifier::hashFile(path);
    if (!digest) {
        std::cerr << "Error: " << digest.error().message << std::endl;
        return 1;
    }
    std::cout << digest.value() << "  " << path << std::endl;
    return 0;
}

int runLoopback(const P2PSettings& settings, const std::string& source, const std::string& destination) {
    EventBus bus;
    auto hub = std::make_shared<MemorySignalingHub>();
    auto rooms = std::make_shared<RoomRegistry>(settings, bus);
    auto transport = std::make_shared<MemoryTransport>(constants::DEFAULT_CHANNEL_CAPACITY);

    // Outlive both services: shutdown publishes cancellation events
    std::mutex mutex;
    std::condition_variable cv;
    std::unordered_map<bool, Transfer> finished;  // keyed by is_sender

    P2PService receiver(settings, bus, nullptr, hub->createEndpoint(), rooms);
    P2PService sender(settings, bus, transport, hub->createEndpoint(), rooms);

    transport->setPeerHandler([&receiver](const std::string&, const std::string& transferId,
                                          std::shared_ptr<IDataChannel> channel) {
        receiver.acceptDataChannel(transferId, std::move(channel)).onError([](const Error& error) {
            std::cerr << "Error: " << error.message << std::endl;
        });
    });

    auto isIncoming = [](const std::any& data) {
        return !std::any_cast<const Transfer&>(data).isSender;
    };

    bus.subscribe(events::TRANSFER_CREATED, [&receiver, &destination](const std::any& data) {
        const auto& transfer = std::any_cast<const Transfer&>(data);
        receiver.receiveFile(transfer.id, destination).onError([](const Error& error) {
            std::cerr << "Error: " << error.message << std::endl;
        });
    }, 0, isIncoming);

    bus.subscribe(events::TRANSFER_PROGRESS, [](const std::any& data) {
        const auto& transfer = std::any_cast<const Transfer&>(data);
        std::cout << "\r  received " << transfer.bytesTransferred << "/" << transfer.metadata.size
                  << " bytes (" << std::fixed << std::setprecision(1) << transfer.progress << "%)"
                  << std::flush;
    }, 0, isIncoming);

    auto onFinished = [&](const std::any& data) {
        const auto& transfer = std::any_cast<const Transfer&>(data);
        std::lock_guard<std::mutex> lock(mutex);
        finished[transfer.isSender] = transfer;
        cv.notify_all();
    };
    for (const char* name : {events::TRANSFER_COMPLETED, events::TRANSFER_FAILED, events::TRANSFER_CANCELLED}) {
        bus.subscribe(name, onFinished);
    }

    for (P2PService* service : {&receiver, &sender}) {
        auto started = service->start();
        if (!started) {
            std::cerr << "Error: " << started.error().message << std::endl;
            return 1;
        }
    }

    auto room = sender.createRoom(2);
    if (!room) {
        std::cerr << "Error: " << room.error().message << std::endl;
        return 1;
    }
    std::cout << "Room " << room.value().roomId << " code " << AccessCode::format(room.value().roomCode) << std::endl;

    auto joined = receiver.joinRoom(room.value().roomCode);
    if (!joined) {
        std::cerr << "Error: " << joined.error().message << std::endl;
        return 1;
    }

    auto transferId = sender.sendFile(room.value().roomId, source);
    if (!transferId) {
        std::cerr << "Error: " << transferId.error().message << std::endl;
        return 1;
    }
    std::cout << "Transfer " << transferId.value() << std::endl;

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return finished.count(true) > 0; });
        // The receiver's last chunk may still be in flight
        if (!cv.wait_for(lock, settings.idleTimeout, [&] { return finished.count(false) > 0; })) {
            std::cerr << "\nError: receiver did not finish" << std::endl;
            return 1;
        }
    }
    std::cout << std::endl;

    int status = 0;
    for (bool isSender : {true, false}) {
        const Transfer& transfer = finished[isSender];
        std::cout << (isSender ? "sender:   " : "receiver: ") << toString(transfer.status);
        if (transfer.error) {
            std::cout << " (" << *transfer.error << ")";
            status = 1;
        } else if (transfer.status != TransferStatus::Completed) {
            status = 1;
        }
        std::cout << std::endl;
    }

    if (status == 0) {
        std::cout << "checksum: " << finished[true].metadata.checksum << std::endl;
    }
    return status;
}

// System file first so the user's file overrides it
std::vector<std::string> defaultConfigPaths() {
    std::vector<std::string> paths{"/etc/cubelink/cubelink.conf"};
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(std::string(home) + "/.config/cubelink/cubelink.conf");
    }
    return paths;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    auto& config = Config::instance();
    logger.setComponent("CLI");
    logger.setConsoleOutput(false);

    std::vector<std::string> positional;
    std::vector<std::string> configPaths;
    bool prometheus = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPaths.push_back(argv[++i]);
        }
        else if (arg == "--prometheus") {
            prometheus = true;
        }
        else if (arg == "--verbose") {
            logger.setConsoleOutput(true);
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            positional.push_back(arg);
        }
    }

    if (configPaths.empty()) {
        if (!config.loadLayered(defaultConfigPaths())) {
            logger.debug("No config file found; using defaults", "CLI");
        }
    }
    for (const auto& path : configPaths) {
        if (!config.loadFromFile(path)) {
            std::cerr << "Error: cannot read config file " << path << std::endl;
            return 1;
        }
    }

    if (!config.validate(P2PSettings::schema())) {
        std::cerr << "Error: invalid configuration" << std::endl;
        return 1;
    }

    logger.setLevel(Logger::parseLevel(config.get("log.level", "info")));
    if (config.hasKey("log.file")) {
        logger.setMaxFileSize(config.getSize("log.max_size_mb", constants::DEFAULT_LOG_MAX_SIZE_MB));
        logger.setLogFile(config.get("log.file"));
    }

    P2PSettings settings = P2PSettings::fromConfig(config);

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    int status = 1;

    if (command == "ice") {
        status = runIce(settings);
    }
    else if (command == "hash" && positional.size() == 2) {
        status = runHash(positional[1]);
    }
    else if (command == "loopback" && positional.size() == 3) {
        status = runLoopback(settings, positional[1], positional[2]);
        logger.info(MetricsCollector::instance().getMetricsSummary(), "CLI");
        if (prometheus) {
            std::cout << MetricsCollector::instance().exportPrometheus();
        }
    }
    else {
        printUsage(argv[0]);
    }

    return status;
}
