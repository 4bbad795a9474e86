#include "health/health_types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace warden::health;

namespace {

HealthSignal make_signal(bool running, bool port, RuntimeHealth health) {
    HealthSignal s;
    s.container_running = running;
    s.port_reachable = port;
    s.runtime_health = health;
    return s;
}

}  // namespace

// Every combination of the three axes
TEST(CompositeStatusTest, TruthTable) {
    const RuntimeHealth healths[] = {RuntimeHealth::HEALTHY, RuntimeHealth::UNHEALTHY, RuntimeHealth::UNKNOWN};

    for (bool running : {false, true}) {
        for (bool port : {false, true}) {
            for (auto health : healths) {
                auto status = composite_of(make_signal(running, port, health));
                SCOPED_TRACE("running=" + std::to_string(running) + " port=" + std::to_string(port) +
                             " health=" + to_string(health));

                if (!running) {
                    EXPECT_EQ(status, CompositeStatus::DOWN);
                } else if (port && health == RuntimeHealth::HEALTHY) {
                    EXPECT_EQ(status, CompositeStatus::HEALTHY);
                } else {
                    EXPECT_EQ(status, CompositeStatus::DEGRADED);
                }
            }
        }
    }
}

TEST(CompositeStatusTest, DownEvenWhenPortAnswers) {
    // Another process holding the port does not make a stopped container healthy
    EXPECT_EQ(composite_of(make_signal(false, true, RuntimeHealth::HEALTHY)), CompositeStatus::DOWN);
}

TEST(CompositeStatusTest, Names) {
    EXPECT_STREQ(to_string(CompositeStatus::HEALTHY), "Healthy");
    EXPECT_STREQ(to_string(CompositeStatus::DEGRADED), "Degraded");
    EXPECT_STREQ(to_string(CompositeStatus::DOWN), "Down");
    EXPECT_STREQ(to_string(RuntimeHealth::UNHEALTHY), "Unhealthy");
    EXPECT_STREQ(to_string(RuntimeHealth::UNKNOWN), "Unknown");
}
