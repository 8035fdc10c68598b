#include "excelpager/ExcelPager.hpp"
#include "excelpager/core/Exception.hpp"
#include "excelpager/server/ApiServer.hpp"
#include "excelpager/utils/Logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

int main(int argc, char* argv[])
{
    // 可选参数：.env 文件路径
    const std::string env_file = argc > 1 ? argv[1] : ".env";

    excelpager::core::ServiceConfig config = [&]() {
        try {
            auto loaded = excelpager::core::ServiceConfig::fromEnvironment(env_file);
            loaded.validate();
            return loaded;
        } catch (const excelpager::core::ConfigException& e) {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            std::exit(EXIT_FAILURE);
        }
    }();

    if (!excelpager::initialize(config)) {
        return EXIT_FAILURE;
    }

    excelpager::server::ApiServer server(config);
    try {
        server.bind().valueOrThrow();
    } catch (const excelpager::core::ExcelPagerException& e) {
        EXCELPAGER_LOG_CRITICAL("Cannot start server: {}", e.getDetailedMessage());
        excelpager::cleanup();
        return EXIT_FAILURE;
    }

    // SIGINT/SIGTERM 在单独线程中等待
    boost::asio::io_context signal_ioc(1);
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            EXCELPAGER_LOG_INFO("Received signal {}, shutting down", signal_number);
            server.stop();
        }
    });
    std::thread signal_thread([&signal_ioc]() { signal_ioc.run(); });

    server.run();

    signal_ioc.stop();
    signal_thread.join();

    excelpager::cleanup();
    return EXIT_SUCCESS;
}
