//------------------------------------------------------------------------------
/*
    This file is part of tronbridge.
    Copyright (c) 2024, the tronbridge developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "app/ProxyApplication.hpp"

#include "proxy/DestinationClient.hpp"
#include "proxy/ForwardingPipeline.hpp"
#include "rpc/RewriteObserver.hpp"
#include "util/build/Build.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"
#include "web/Request.hpp"
#include "web/Response.hpp"
#include "web/Server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/system/error_code.hpp>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace app {

namespace {

// the calling thread is one of the workers
void
runOnThreads(boost::asio::io_context& ioc, std::uint32_t threads)
{
    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    while (workers.size() + 1 < threads)
        workers.emplace_back([&ioc] { ioc.run(); });

    ioc.run();
    for (auto& worker : workers)
        worker.join();
}

}  // namespace

ProxyApplication::ProxyApplication(util::Config const& config) : config_(config)
{
    LOG(util::LogService::info()) << "Tronbridge version: " << util::build::getTronbridgeFullVersionString();
}

int
ProxyApplication::run()
{
    auto const threads = config_.valueOr<std::uint32_t>("io_threads", kDEFAULT_IO_THREADS);
    if (threads == 0) {
        LOG(util::LogService::fatal()) << "io_threads is less than 1";
        return EXIT_FAILURE;
    }
    LOG(util::LogService::info()) << "Number of io threads = " << threads;

    boost::asio::io_context ioc{static_cast<int>(threads)};

    auto destination = proxy::make_DestinationClient(config_);
    if (not destination.has_value()) {
        LOG(util::LogService::fatal()) << "Error creating destination client: " << destination.error();
        return EXIT_FAILURE;
    }
    auto const destinationUrl = destination->url();

    auto pipeline = std::make_shared<proxy::ForwardingPipeline const>(
        std::make_shared<proxy::DestinationClient const>(std::move(destination).value()),
        std::make_shared<rpc::LoggingRewriteObserver const>()
    );

    auto expectedServer = web::make_Server(config_, ioc);
    if (not expectedServer.has_value()) {
        LOG(util::LogService::fatal()) << "Error creating web server: " << expectedServer.error();
        return EXIT_FAILURE;
    }
    auto& server = expectedServer.value();

    server.onPost("/", [pipeline](web::Request const& request, boost::asio::yield_context yield) {
        return pipeline->handleRpc(request, yield);
    });
    server.onGet("/", [pipeline](web::Request const& request, boost::asio::yield_context yield) {
        return pipeline->handleGet(request, yield);
    });
    server.onFallback([pipeline](web::Request const& request, boost::asio::yield_context yield) {
        return pipeline->handleFallback(request, yield);
    });

    if (auto const maybeError = server.run(); maybeError.has_value()) {
        LOG(util::LogService::fatal()) << "Error starting web server: " << *maybeError;
        return EXIT_FAILURE;
    }

    LOG(util::LogService::info()) << "Starting proxy server on port " << server.endpoint().port()
                                  << " forwarding to " << (destinationUrl.isSsl() ? "https://" : "http://")
                                  << destinationUrl.authority() << destinationUrl.target;

    boost::asio::signal_set stopSignals{ioc, SIGINT, SIGTERM};
    stopSignals.async_wait([&ioc](boost::system::error_code const& error, int signal) {
        if (error)
            return;
        LOG(util::LogService::info()) << "Received signal " << signal << ", stopping";
        ioc.stop();
    });

    runOnThreads(ioc, threads);

    LOG(util::LogService::info()) << "Proxy stopped";
    return EXIT_SUCCESS;
}

}  // namespace app
