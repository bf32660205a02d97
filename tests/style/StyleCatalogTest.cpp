#include <gtest/gtest.h>
#include <drawlink/drawlink.h>

#include <filesystem>
#include <fstream>

using namespace drawlink;

namespace fs = std::filesystem;

// ============================================================================
// StyleCatalogTest - built-in styles and icon bundle loading
// ============================================================================

class StyleCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        bundleDir_ = fs::temp_directory_path() / (std::string("drawlink_icons_") + info->name());
        fs::remove_all(bundleDir_);
        fs::create_directories(bundleDir_ / "compute");
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(bundleDir_ / "compute", fs::perms::owner_all, ec);
        fs::remove_all(bundleDir_, ec);
    }

    void writeFile(const fs::path& relative, const std::string& content) {
        std::ofstream out(bundleDir_ / relative, std::ios::binary);
        out << content;
    }

    fs::path bundleDir_;
};

// --- Built-ins ---

TEST_F(StyleCatalogTest, BuiltinContainersHaveNoFixedSize) {
    StyleCatalog catalog;

    for (const char* type : {"account", "availabilityZone", "region", "subnet", "type", "vpc"}) {
        ASSERT_TRUE(catalog.contains(type)) << type;
        StyleEntry entry = catalog.resolve(type);
        EXPECT_FALSE(entry.style.empty()) << type;
        EXPECT_FALSE(entry.hasFixedSize()) << type;
    }
}

TEST_F(StyleCatalogTest, EdgeStyleIsBuiltin) {
    StyleCatalog catalog;

    EXPECT_TRUE(catalog.contains(EDGE_STYLE_ID));
    EXPECT_NE(catalog.edgeStyle().style.find("endArrow=block"), std::string::npos);
}

TEST_F(StyleCatalogTest, UnknownTypeResolvesToDefaultIcon) {
    StyleCatalog catalog;

    StyleEntry entry = catalog.resolve("no-such-icon");
    EXPECT_EQ(entry.style, StyleCatalog::defaultEntry().style);
    EXPECT_DOUBLE_EQ(entry.width.value(), DEFAULT_ICON_SIZE);
    EXPECT_DOUBLE_EQ(entry.height.value(), DEFAULT_ICON_SIZE);
    EXPECT_NE(entry.style.find("mxgraph.aws4.resourceIcon"), std::string::npos);
}

TEST_F(StyleCatalogTest, RegisterTypeOverridesEntry) {
    StyleCatalog catalog;
    catalog.registerType("vpc", StyleEntry{"custom;", 10.0, 20.0});

    StyleEntry entry = catalog.resolve("vpc");
    EXPECT_EQ(entry.style, "custom;");
    EXPECT_DOUBLE_EQ(entry.width.value(), 10.0);
    EXPECT_DOUBLE_EQ(entry.height.value(), 20.0);
}

TEST_F(StyleCatalogTest, ImageStyleEmbedsBase64Svg) {
    std::string style = StyleCatalog::imageStyle("<svg/>");

    EXPECT_NE(style.find("shape=image;"), std::string::npos);
    EXPECT_NE(style.find("image=data:image/svg+xml,PHN2Zy8+"), std::string::npos);
}

// --- Icon bundle ---

TEST_F(StyleCatalogTest, LoadIconBundleRegistersSvgStems) {
    writeFile("Arch_Amazon-EC2_48.svg", "<svg>ec2</svg>");
    writeFile("compute/Lambda.svg", "<svg>lambda</svg>");
    writeFile("README.txt", "not an icon");

    StyleCatalog catalog;
    size_t before = catalog.size();
    size_t added = catalog.loadIconBundle(bundleDir_);

    EXPECT_EQ(added, 2u);
    EXPECT_EQ(catalog.size(), before + 2);
    EXPECT_TRUE(catalog.isBundleLoaded());
    EXPECT_TRUE(catalog.contains("Arch_Amazon-EC2_48"));
    EXPECT_TRUE(catalog.contains("Lambda"));
    EXPECT_FALSE(catalog.contains("README"));

    StyleEntry entry = catalog.resolve("Lambda");
    EXPECT_EQ(entry.style, StyleCatalog::imageStyle("<svg>lambda</svg>"));
    EXPECT_DOUBLE_EQ(entry.width.value(), DEFAULT_ICON_SIZE);
}

TEST_F(StyleCatalogTest, BundleDoesNotReplaceExistingEntries) {
    writeFile("vpc.svg", "<svg>vpc</svg>");

    StyleCatalog catalog;
    std::string builtin = catalog.resolve("vpc").style;

    EXPECT_EQ(catalog.loadIconBundle(bundleDir_), 0u);
    EXPECT_EQ(catalog.resolve("vpc").style, builtin);
}

TEST_F(StyleCatalogTest, BundleLoadsAtMostOnce) {
    writeFile("first.svg", "<svg/>");

    StyleCatalog catalog;
    EXPECT_EQ(catalog.loadIconBundle(bundleDir_), 1u);

    writeFile("second.svg", "<svg/>");
    EXPECT_EQ(catalog.loadIconBundle(bundleDir_), 0u);
    EXPECT_FALSE(catalog.contains("second"));
}

TEST_F(StyleCatalogTest, MissingBundleDirectoryThrows) {
    StyleCatalog catalog;

    EXPECT_THROW(catalog.loadIconBundle(bundleDir_ / "does-not-exist"), StyleCatalogError);
    EXPECT_FALSE(catalog.isBundleLoaded());

    // A failed load leaves the catalog loadable
    writeFile("late.svg", "<svg/>");
    EXPECT_EQ(catalog.loadIconBundle(bundleDir_), 1u);
}

TEST_F(StyleCatalogTest, UnreadableIconLeavesCatalogUntouched) {
    writeFile("a.svg", "<svg>a</svg>");
    writeFile("b.svg", "<svg>b</svg>");
    fs::permissions(bundleDir_ / "b.svg", fs::perms::none);
    if (std::ifstream(bundleDir_ / "b.svg").is_open()) {
        GTEST_SKIP() << "file permissions are not enforced for this user";
    }

    StyleCatalog catalog;
    size_t before = catalog.size();

    EXPECT_THROW(catalog.loadIconBundle(bundleDir_), StyleCatalogError);
    EXPECT_EQ(catalog.size(), before);
    EXPECT_FALSE(catalog.contains("a"));
    EXPECT_FALSE(catalog.isBundleLoaded());

    fs::permissions(bundleDir_ / "b.svg", fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(catalog.loadIconBundle(bundleDir_), 2u);
    EXPECT_TRUE(catalog.contains("a"));
    EXPECT_TRUE(catalog.contains("b"));
}

TEST_F(StyleCatalogTest, UnreadableSubdirectoryIsStyleCatalogError) {
    writeFile("compute/Lambda.svg", "<svg/>");
    fs::permissions(bundleDir_ / "compute", fs::perms::none);
    std::error_code listError;
    fs::directory_iterator check(bundleDir_ / "compute", listError);
    if (!listError) {
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    StyleCatalog catalog;
    size_t before = catalog.size();

    EXPECT_THROW(catalog.loadIconBundle(bundleDir_), StyleCatalogError);
    EXPECT_EQ(catalog.size(), before);
}

TEST_F(StyleCatalogTest, SharedCatalogIsSingleInstance) {
    EXPECT_EQ(&StyleCatalog::shared(), &StyleCatalog::shared());
    EXPECT_TRUE(StyleCatalog::shared().contains("vpc"));
}
