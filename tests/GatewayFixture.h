//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayFixture.h
// Purpose: Running Gateway on ephemeral ports with a FakeExecutor, for adapter tests
//==========================================================================================================

#pragma once

#include <gtest/gtest.h>

#include "mcpgw/BuiltinCatalog.h"
#include "mcpgw/Gateway.h"
#include "FakeExecutor.h"
#include "TestClients.h"

namespace mcpgw {
namespace test {

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake = std::make_shared<FakeExecutor>();
        config.httpPort = "0";
        config.wsPort = "0";
        config.toolTimeout = std::chrono::milliseconds(2000);
        config.sseKeepAlive = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        if (gateway) {
            gateway->Stop().get();
        }
        fake->JoinWorkers();
    }

    void StartGateway() {
        gateway = std::make_unique<Gateway>(config, MakeBuiltinCatalog(), fake);
        gateway->Start().get();
    }

    GatewayConfig config;
    std::shared_ptr<FakeExecutor> fake;
    std::unique_ptr<Gateway> gateway;
};

} // namespace test
} // namespace mcpgw
