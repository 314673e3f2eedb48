/**
 * @file vendor_lookup_test.cpp
 * @brief Tests for MAC prefix to vendor resolution.
 */

#include "lanmonitor/VendorLookup.h"

#include <gtest/gtest.h>

using namespace LanMonitor;

TEST(VendorLookupTest, BuiltinTableResolvesRaspberryPi) {
    VendorLookup vendors;
    auto v = vendors.lookup("B8:27:EB:11:22:33");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "Raspberry Pi");
}

TEST(VendorLookupTest, AcceptsAnySeparatorStyle) {
    EXPECT_EQ(VendorLookup::lookupBuiltin("b8-27-eb-11-22-33").value_or(""), "Raspberry Pi");
    EXPECT_EQ(VendorLookup::lookupBuiltin("b827.eb11.2233").value_or(""), "Raspberry Pi");
    EXPECT_EQ(VendorLookup::lookupBuiltin("B827EB112233").value_or(""), "Raspberry Pi");
}

TEST(VendorLookupTest, UnknownPrefixReturnsNothing) {
    VendorLookup vendors;
    EXPECT_FALSE(vendors.lookup("02:00:00:00:00:01").has_value());
    EXPECT_FALSE(vendors.lookup("zz").has_value());
}

TEST(VendorLookupTest, LoadedTableTakesPrecedenceOverBuiltin) {
    VendorLookup vendors;
    std::string err;
    ASSERT_TRUE(vendors.loadFromJson(nlohmann::json::parse(R"([
        {"macPrefix": "B8:27:EB", "vendorName": "Raspberry Pi Foundation"},
        {"macPrefix": "70:B3:D5:1", "vendorName": "Sub-block Vendor"},
        {"macPrefix": "AA:BB:CC"},
        "not an entry"
    ])"), err)) << err;

    EXPECT_EQ(vendors.size(), 2u);
    EXPECT_EQ(vendors.lookup("b8:27:eb:00:00:01").value_or(""), "Raspberry Pi Foundation");
    EXPECT_EQ(vendors.lookup("70:b3:d5:1f:00:01").value_or(""), "Sub-block Vendor");
    EXPECT_FALSE(vendors.lookup("70:b3:d5:2f:00:01").has_value());
}

TEST(VendorLookupTest, NonArrayDocumentIsRejected) {
    VendorLookup vendors;
    std::string err;
    EXPECT_FALSE(vendors.loadFromJson(nlohmann::json::object(), err));
    EXPECT_FALSE(err.empty());
}
