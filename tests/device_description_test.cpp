#include <gtest/gtest.h>

#include "device_description.hpp"

static const char* location = "http://192.168.1.10:1400/xml/device_description.xml";

TEST(StableId, LowerCasesAndRemovesSpaces)
{
    EXPECT_EQ(upnp::make_stable_id("Living Room"), "livingroom");
    EXPECT_EQ(upnp::make_stable_id("Kitchen"), "kitchen");
    EXPECT_EQ(upnp::make_stable_id(" Master  Bed Room "), "masterbedroom");
}

TEST(StableId, KeepsOtherWhitespace)
{
    EXPECT_EQ(upnp::make_stable_id("Living\tRoom"), "living\troom");
    EXPECT_NE(upnp::make_stable_id("Living\tRoom"), upnp::make_stable_id("Living Room"));
}

TEST(StableId, CollidingNamesShareAnId)
{
    EXPECT_EQ(upnp::make_stable_id("Living Room"), upnp::make_stable_id("LivingRoom"));
}

TEST(BaseUrl, StripsPath)
{
    EXPECT_EQ(upnp::base_url("http://192.168.1.10:1400/xml/device.xml"), "http://192.168.1.10:1400");
    EXPECT_EQ(upnp::base_url("http://192.168.1.10:1400"), "http://192.168.1.10:1400");
    EXPECT_EQ(upnp::base_url("https://host/a/b"), "https://host");
    EXPECT_EQ(upnp::base_url("not a url"), "not a url");
}

TEST(DeviceDescription, RoomNameOnly)
{
    auto record = upnp::parse_description(
        "<?xml version=\"1.0\"?><root xmlns=\"urn:schemas-upnp-org:device-1-0\"><device><roomName>Kitchen</roomName></device></root>",
        location);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->display_name, "Kitchen");
    EXPECT_EQ(record->stable_id, "kitchen");
    EXPECT_EQ(record->control_base_url, "http://192.168.1.10:1400");
}

TEST(DeviceDescription, RoomNameWinsOverDisplayName)
{
    auto record = upnp::parse_description(
        "<root><device><displayName>Play:1</displayName><roomName>Living Room</roomName></device></root>", location);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->display_name, "Living Room");
    EXPECT_EQ(record->stable_id, "livingroom");
}

TEST(DeviceDescription, FallsBackToDisplayName)
{
    auto record = upnp::parse_description(
        "<root><device><roomName>   </roomName><displayName> Office </displayName></device></root>", location);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->display_name, "Office");
}

TEST(DeviceDescription, EmptyNamesYieldNothing)
{
    EXPECT_FALSE(upnp::parse_description(
        "<root><device><roomName></roomName><displayName> </displayName></device></root>", location).has_value());
    EXPECT_FALSE(upnp::parse_description("<root><device><modelName>One</modelName></device></root>", location).has_value());
}

TEST(DeviceDescription, MalformedDocumentsYieldNothing)
{
    EXPECT_FALSE(upnp::parse_description("<root><device><roomName>Kitchen</device>", location).has_value());
    EXPECT_FALSE(upnp::parse_description("", location).has_value());
    EXPECT_FALSE(upnp::parse_description("<root><specVersion/></root>", location).has_value());
}

TEST(DeviceDescription, DecodesEntitiesInNames)
{
    auto record = upnp::parse_description("<root><device><roomName>Bar &amp; Grill</roomName></device></root>", location);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->display_name, "Bar & Grill");
    EXPECT_EQ(record->stable_id, "bar&grill");
}

TEST(DeviceDescription, RealisticZonePlayerDocument)
{
    const char* doc = R"(<?xml version="1.0" encoding="utf-8" ?>
<root xmlns="urn:schemas-upnp-org:device-1-0">
  <specVersion><major>1</major><minor>0</minor></specVersion>
  <device>
    <deviceType>urn:schemas-upnp-org:device:ZonePlayer:1</deviceType>
    <friendlyName>192.168.1.10 - Sonos One</friendlyName>
    <manufacturer>Sonos, Inc.</manufacturer>
    <modelName>Sonos One</modelName>
    <displayName>One</displayName>
    <roomName>Bathroom</roomName>
    <serviceList>
      <service><serviceType>urn:schemas-upnp-org:service:AlarmClock:1</serviceType></service>
    </serviceList>
  </device>
</root>)";

    auto record = upnp::parse_description(doc, location);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->display_name, "Bathroom");
    EXPECT_EQ(record->stable_id, "bathroom");
}
