/**
 * @file Commands.cpp
 * @brief Receiver / discovery / sender entry points
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/Commands.h"
#include "quicksend/Debug.h"
#include "quicksend/DiscoveryBroadcaster.h"
#include "quicksend/DiscoveryListener.h"
#include "quicksend/ThreadSafeLog.h"
#include "quicksend/TransferClient.h"
#include "quicksend/TransferServer.h"
#include <memory>

namespace QuickSend {

bool startReceiver(const ReceiverOptions& options, TransferStats& stats, TransferError& error) {
    TransferServer server(options.port, options.bindAddress);
    server.setOutputDir(options.outputDir);
    server.setStripPrefix(options.stripPrefix);
    server.setConnectionTimeout(options.settings.connectionTimeoutMs);
    server.setBufferSize(options.settings.bufferSize);

    if (!server.bind(error)) {
        return false;
    }

    LOG_INFO("Waiting for sender on " << PeerAddress(options.bindAddress, server.getPort()).toString()
             << (options.stripPrefix ? " (stripping common prefix)" : ""));

    // Broadcaster starts only once the port is known; it announces the bound port
    std::unique_ptr<DiscoveryBroadcaster> broadcaster;
    if (options.broadcast) {
        broadcaster = std::make_unique<DiscoveryBroadcaster>(
            server.getPort(), options.settings.discoveryPort,
            options.settings.broadcastIntervalMs);
        if (!options.broadcastTargets.empty()) {
            broadcaster->setTargets(options.broadcastTargets);
        }

        std::string errorMsg;
        if (!broadcaster->start(errorMsg)) {
            LOG_WARNING("Cannot broadcast own address, direct IP must be used: " << errorMsg);
            broadcaster.reset();
        }
    }

    server.setAcceptCallback([&broadcaster](const PeerAddress&) {
        if (broadcaster) {
            broadcaster->stop();
        }
    });

    if (options.onListening) {
        options.onListening(server.getPort());
    }

    bool ok = server.serveOne(stats, error);

    if (broadcaster) {
        broadcaster->stop();
    }
    return ok;
}

bool resolveViaDiscovery(uint32_t timeoutMs, uint16_t discoveryPort,
                         PeerAddress& receiver, TransferError& error)
{
    LOG_INFO("Searching for a receiver on UDP port " << discoveryPort
             << " (timeout " << timeoutMs << " ms)");

    DiscoveryListener listener(discoveryPort);
    if (!listener.waitForAnnouncement(timeoutMs, receiver, error)) {
        ThreadSafeLog::log("Discovery failed: " + error.toString());
        return false;
    }

    ThreadSafeLog::log("Discovered receiver " + receiver.toString());
    return true;
}

bool sendFiles(const PeerAddress& receiver, const std::vector<std::string>& orderedPaths,
               const Settings& settings, TransferStats& stats, TransferError& error)
{
    TransferClient client(orderedPaths);
    client.setConnectionTimeout(settings.connectionTimeoutMs);
    client.setBufferSize(settings.bufferSize);

    // Pre-flight before any network activity
    if (!client.prepare(error)) {
        return false;
    }

    if (!client.getPrefixHint().empty()) {
        LOG_DEBUG("Common path prefix: " << client.getPrefixHint());
    }

    return client.send(receiver, stats, error);
}

}  // namespace QuickSend
