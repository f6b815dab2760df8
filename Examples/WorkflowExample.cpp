//
// Order pipeline with a payment step that runs in a second engine behind the bridge.
//

#include <chrono>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include "../src/FlowCore.h"
using namespace FlowEngine;
using namespace Core;
using namespace Flow;

namespace {

    const char* DefaultConfig = R"({
        "order": "fifo",
        "logLevel": "info",
        "bridge": {"targetUrl": "fx://payments/flowStep", "timeoutMs": 2000}
    })";

    std::string readConfig(int argc, char** argv) {
        if (argc < 2) {
            return DefaultConfig;
        }
        std::ifstream file(argv[1]);
        if (!file) {
            throw std::runtime_error(std::string("Cannot open config file ") + argv[1]);
        }
        std::stringstream text;
        text << file.rdbuf();
        return text.str();
    }

    StepDefinition chargeStep() {
        StepDefinition charge;
        charge.executionDomain = ExecutionDomain::Remote;
        charge.effect = [](StepContext& ctx) {
            auto cents = ctx.input().at("total").asInt();
            ctx.log("charged", cents, ctx.traceId());
            Value receipt(Value::Object{});
            receipt["total"] = cents;
            receipt["status"] = "paid";
            return receipt;
        };
        RetrySpec retry;
        retry.maxAttempts = 3;
        retry.backoffMs = 50;
        charge.retry = retry;
        return charge;
    }

}

int main(int argc, char** argv) {
    WorkflowEngineConfig config;
    try {
        config = parseEngineConfig(readConfig(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "Bad config: " << e.what() << "\n";
        return 1;
    }

    // The payments side: same workflow id, only the steps it serves
    Store::MemoryStore paymentsStore;
    WorkflowEngineConfig paymentsConfig;
    paymentsConfig.processDomain = ExecutionDomain::Remote;
    WorkflowEngine payments(paymentsStore, paymentsConfig);
    payments.createWorkflow("order-1001")->defineStep("charge", chargeStep());

    Store::MemoryStore store;
    EngineServices services;
    services.transport = std::make_shared<Bridge::InProcessTransport>([&payments](const std::string& body) {
        return payments.serveRemote(body);
    });
    WorkflowEngine engine(store, config, services);

    engine.on(Events::StepAfter, [](const WorkflowEvent& e) {
        std::cout << e.instanceId << "/" << e.stepName << " -> " << toJsonString(e.output) << "\n";
    });
    engine.on(Events::StepError, [](const WorkflowEvent& e) {
        std::cerr << e.instanceId << "/" << e.stepName << " failed: " << e.error << "\n";
    });

    auto order = engine.createWorkflow("order-1001");

    StepDefinition validate;
    validate.guard = [](StepContext& ctx) { return ctx.input().contains("items"); };
    validate.staticNext = {"price"};
    order->defineStep("validate", validate);

    StepDefinition price;
    price.effect = [](StepContext& ctx) {
        int64_t total = 0;
        for (const auto& item : ctx.input().at("items").asArray()) {
            total += item.at("cents").asInt() * item.at("qty").asInt();
        }
        Value priced = ctx.input();
        priced["total"] = total;
        return priced;
    };
    price.staticNext = {"charge"};
    order->defineStep("price", price);

    auto charge = chargeStep();
    charge.staticNext = {"route"};
    order->defineStep("charge", charge);

    StepDefinition route;
    route.branch = MultiwayBranch{
        [](StepContext& ctx) { return ctx.shared()["country"].asString(); },
        {{"US", "shipDomestic"}, {"CA", "shipCanada"}},
        std::string("shipInternational")};
    order->defineStep("route", route);

    for (const char* name : {"shipDomestic", "shipCanada", "shipInternational"}) {
        StepDefinition ship;
        ship.effect = [](StepContext& ctx) { return Value(std::string("label for ") + ctx.stepName()); };
        order->defineStep(name, ship);
    }

    order->shared()["country"] = "CA";

    Value item(Value::Object{});
    item["sku"] = "tea";
    item["cents"] = 450;
    item["qty"] = 3;
    Value request(Value::Object{});
    request["items"] = Value(Value::Array{item});

    order->start("validate", request);

    // A retry would continue on the timer thread
    while (order->pendingRetries() > 0 || order->suspendedCount() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto stats = order->getStats();
    FLOW_LOG_INFO(std::format("order-1001 ran {} steps ({} failures, {} fallbacks)",
        stats.steps, stats.failures, stats.fallbacks));
    std::cout << order->serialize() << "\n";
    return 0;
}
