#include "core/common/CacheErrors.h"
#include "core/config/StrataConfig.h"
#include "core/datastore/impl/MemoryKeyValueStore.h"
#include "core/distributed/core/LocalPubSubTransport.h"
#include "core/engine/CacheEngine.h"
#include "core/logging/Log.h"

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace strata;
using namespace strata::core;

namespace {

void printStatistics(const std::string& name, const engine::CacheEngine& engine) {
    std::cout << "--- " << name << " ---" << std::endl;
    for (const auto& [key, value] : engine.getStatistics()) {
        std::cout << "  " << key << " = " << value << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    const std::filesystem::path config_path = argc > 1 ? argv[1] : "config/strata.json";

    config::StrataConfig cfg;
    try {
        if (std::filesystem::exists(config_path)) {
            cfg = config::loadStrataConfig(config_path);
        } else {
            std::cerr << "Config file " << config_path << " not found, using defaults" << std::endl;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    // 두 노드가 같은 전송 계층을 공유해야 무효화가 전파됨
    cfg.distributed.enabled = true;

    logging::initialize_logger(cfg.logging);

    spdlog::info("========================================");
    spdlog::info("  Strata Cache Engine Demo");
    spdlog::info("========================================");

    auto transport = std::make_shared<distributed::LocalPubSubTransport>();
    transport->start();

    // 노드별 저장소, 전송 계층은 공유
    auto store_a = std::make_shared<datastore::MemoryKeyValueStore>();
    auto store_b = std::make_shared<datastore::MemoryKeyValueStore>();

    std::unique_ptr<engine::CacheEngine> node_a;
    std::unique_ptr<engine::CacheEngine> node_b;
    try {
        node_a = std::make_unique<engine::CacheEngine>(
            cfg, engine::createEngineDependencies(cfg, store_a, transport));
        node_b = std::make_unique<engine::CacheEngine>(
            cfg, engine::createEngineDependencies(cfg, store_b, transport));
    } catch (const CacheError& e) {
        spdlog::error("Failed to create cache engines: {} ({})", e.what(), toString(e.kind()));
        logging::shutdown_logger();
        return 1;
    }

    node_a->start();
    node_b->start();

    const std::string user_key = node_a->generateKey("UsersController", "GetUser", {{"id", int64_t{42}}});
    const std::string orders_key = node_a->generateKey("OrdersController", "GetOrders",
                                                       {{"userId", int64_t{42}}, {"status", std::string("open")}});
    spdlog::info("Generated keys: {} / {}", user_key, orders_key);

    node_a->set(user_key, R"({"id":42,"name":"Alice"})", {"Users"});
    node_b->set(user_key, R"({"id":42,"name":"Alice"})", {"Users"});
    node_a->set(orders_key, R"([{"id":1,"status":"open"}])", {"Orders", "Users"});
    node_b->set(orders_key, R"([{"id":1,"status":"open"}])", {"Orders", "Users"});

    for (int i = 0; i < 25; ++i) {
        node_a->get(user_key);
    }
    if (node_a->dependencies().hasIntelligence()) {
        auto adaptive = node_a->dependencies().intelligence->calculateAdaptiveTtl(user_key);
        spdlog::info("Adaptive TTL for hot key {}: {}ms", user_key, adaptive.count());
        for (const auto& hot : node_a->dependencies().intelligence->getHotKeys(5)) {
            spdlog::info("  hot key {} ({} accesses, {:.1f}/min)", hot.key, hot.access_count, hot.access_rate);
        }
    }

    auto result = node_a->invalidate("Users");
    spdlog::info("Node A invalidated Users: {} of {} keys", result.invalidated, result.attempted);

    if (!transport->waitUntilIdle(std::chrono::seconds(2))) {
        spdlog::warn("Transport did not drain within 2s, node B may not have applied the invalidation yet");
    }

    spdlog::info("Node B still has user key: {}", node_b->get(user_key).has_value());
    spdlog::info("Node B still has orders key: {}", node_b->get(orders_key).has_value());

    printStatistics("node A", *node_a);
    printStatistics("node B", *node_b);

    node_b->stop();
    node_a->stop();
    transport->stop();

    spdlog::info("Demo finished");
    logging::shutdown_logger();
    return 0;
}
