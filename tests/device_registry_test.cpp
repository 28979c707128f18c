#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

#include "device_registry.hpp"

static upnp::device_record make_record(const std::string& name, const std::string& base = "http://10.0.0.1:1400")
{
    return upnp::device_record {name, upnp::make_stable_id(name), base};
}

static std::map<std::string, upnp::device_record> make_set(const std::vector<std::string>& names)
{
    std::map<std::string, upnp::device_record> devices;
    for(const auto& name : names)
    {
        auto record = make_record(name);
        devices.emplace(record.stable_id, record);
    }
    return devices;
}

TEST(DeviceRegistry, StartsEmpty)
{
    upnp::device_registry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.list().empty());
    EXPECT_FALSE(registry.lookup("kitchen").has_value());
}

TEST(DeviceRegistry, ReplaceListAndLookup)
{
    upnp::device_registry registry;
    registry.replace(make_set({"Living Room", "Kitchen"}));

    auto devices = registry.list();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].stable_id, "kitchen");
    EXPECT_EQ(devices[1].stable_id, "livingroom");

    auto kitchen = registry.lookup("kitchen");
    ASSERT_TRUE(kitchen.has_value());
    EXPECT_EQ(kitchen->display_name, "Kitchen");
    EXPECT_TRUE(registry.contains("livingroom"));
    EXPECT_FALSE(registry.contains("Living Room"));
}

TEST(DeviceRegistry, ReplaceDropsDevicesOfThePreviousPass)
{
    upnp::device_registry registry;
    registry.replace(make_set({"Living Room", "Kitchen"}));
    registry.replace(make_set({"Office"}));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(registry.contains("kitchen"));
    EXPECT_TRUE(registry.contains("office"));
}

TEST(DeviceRegistry, RejectsKeysThatAreNotStableIds)
{
    upnp::device_registry registry;
    registry.replace(make_set({"Kitchen"}));

    std::map<std::string, upnp::device_record> broken;
    broken.emplace("office", make_record("Office"));
    broken.emplace("Kitchen", make_record("Kitchen"));

    EXPECT_THROW(registry.replace(broken), std::invalid_argument);
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.contains("kitchen"));
}

TEST(DeviceRegistry, ReadersSeeWholeSetsDuringReplace)
{
    upnp::device_registry registry;
    const auto first = make_set({"A1", "A2", "A3"});
    const auto second = make_set({"B1", "B2", "B3", "B4", "B5"});
    registry.replace(first);

    std::atomic<bool> stop {false};
    std::atomic<int> torn {0};
    std::vector<std::thread> readers;
    for(int i = 0; i < 4; ++i)
    {
        readers.emplace_back([&]() {
            while(!stop.load())
            {
                auto devices = registry.list();
                // Either all ids start with "a" (3 of them) or all with "b" (5 of them)
                char prefix = devices.empty() ? '?' : devices.front().stable_id.front();
                size_t expected = (prefix == 'a') ? 3 : 5;
                bool uniform = std::all_of(devices.begin(), devices.end(), [prefix](const upnp::device_record& d) {
                    return d.stable_id.front() == prefix;
                });
                if(devices.size() != expected || !uniform)
                    torn.fetch_add(1);
            }
        });
    }

    for(int i = 0; i < 2000; ++i)
        registry.replace((i % 2 == 0) ? second : first);

    stop.store(true);
    for(auto& t : readers)
        t.join();

    EXPECT_EQ(torn.load(), 0);
}
