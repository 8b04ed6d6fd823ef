#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace passgen;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    reg.increment_counter("test_counter", 1.0);
    reg.increment_counter("test_counter", 2.5);

    EXPECT_EQ(reg.get_counter("test_counter"), 3.5);
    std::string prometheus = reg.collect_prometheus();
    EXPECT_TRUE(prometheus.find("test_counter 3.5") != std::string::npos);
    EXPECT_TRUE(prometheus.find("# TYPE test_counter counter") != std::string::npos);
}

TEST(MetricsTest, Gauge) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.set_gauge("test_gauge", 42.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 42.0);

    reg.increment_gauge("test_gauge", 8.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 50.0);

    reg.decrement_gauge("test_gauge", 10.0);
    EXPECT_EQ(reg.get_gauge("test_gauge"), 40.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_TRUE(prometheus.find("test_gauge 40") != std::string::npos);
    EXPECT_TRUE(prometheus.find("# TYPE test_gauge gauge") != std::string::npos);
}

TEST(MetricsTest, ResetZeroesServiceSeries) {
    auto& reg = MetricsRegistry::instance();
    reg.increment_counter(metric::PASSWORDS_GENERATED);
    reg.set_gauge(metric::ACTIVE_CONNECTIONS, 3);
    reg.increment_counter("ad_hoc_total");
    reg.reset();

    EXPECT_EQ(reg.get_counter(metric::PASSWORDS_GENERATED), 0.0);
    EXPECT_EQ(reg.get_gauge(metric::ACTIVE_CONNECTIONS), 0.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("passwords_generated_total 0\n"), std::string::npos);
    EXPECT_NE(prometheus.find("active_connections 0\n"), std::string::npos);
    EXPECT_EQ(prometheus.find("ad_hoc_total"), std::string::npos);
}

TEST(MetricsTest, ServiceSeriesCarryHelpAndType) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    std::string prometheus = reg.collect_prometheus();
    for (const char* name : {metric::HTTP_REQUESTS, metric::PASSWORDS_GENERATED, metric::GENERATE_REJECTED,
                             metric::GENERATE_FAILED, metric::CONNECTIONS_REJECTED}) {
        EXPECT_NE(prometheus.find(std::string("# HELP ") + name + " "), std::string::npos) << name;
        EXPECT_NE(prometheus.find(std::string("# TYPE ") + name + " counter"), std::string::npos) << name;
    }
    EXPECT_NE(prometheus.find("# TYPE active_connections gauge"), std::string::npos);
}

TEST(MetricsTest, NameIsBoundToOneKind) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    EXPECT_THROW(reg.set_gauge(metric::HTTP_REQUESTS, 1.0), std::logic_error);
    EXPECT_THROW(reg.increment_counter(metric::ACTIVE_CONNECTIONS), std::logic_error);

    reg.increment_counter("mixed_total");
    EXPECT_THROW(reg.increment_gauge("mixed_total"), std::logic_error);
    EXPECT_EQ(reg.get_gauge("mixed_total"), 0.0);
    EXPECT_EQ(reg.get_counter("mixed_total"), 1.0);
}
