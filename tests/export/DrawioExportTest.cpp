#include <gtest/gtest.h>
#include <drawlink/drawlink.h>
#include <drawlink/common/Logger.h>

#include <pugixml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace drawlink;

// ============================================================================
// DrawioExportTest - mxGraphModel document structure
// ============================================================================

class DrawioExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_.registerType("box40", StyleEntry{"shape=box40;", 40.0, 40.0});

        DiagramRequest request;
        request.nodes.emplace_back("vpc", "vpc", "Main VPC", "Network", Point{50, 0});
        NodeDescriptor a("a", "resource", "Web", "EC2", Point{0, 0});
        a.image = "icons/box40.svg";
        a.parent = "vpc";
        request.nodes.push_back(a);
        NodeDescriptor b("b", "resource", "Db", "RDS", Point{100, 0});
        b.image = "icons/box40.svg";
        b.parent = "vpc";
        request.nodes.push_back(b);
        request.edges.emplace_back("e1", "a", "b");

        graph_ = DiagramGraph::fromRequest(request);
        layout_ = ContainmentLayout(catalog_).layout(graph_);
    }

    static void parse(const std::string& xml, pugi::xml_document& doc) {
        pugi::xml_parse_result result = doc.load_string(xml.c_str());
        ASSERT_TRUE(result) << result.description();
    }

    StyleCatalog catalog_;
    DiagramGraph graph_;
    LayoutResult layout_;
};

// --- Structure ---

TEST_F(DrawioExportTest, DocumentStartsWithRootAndLayerCells) {
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph_, layout_), doc);

    pugi::xml_node root = doc.child("mxGraphModel").child("root");
    ASSERT_TRUE(root);

    pugi::xml_node first = root.first_child();
    EXPECT_STREQ(first.name(), "mxCell");
    EXPECT_STREQ(first.attribute("id").value(), "0");

    pugi::xml_node second = first.next_sibling();
    EXPECT_STREQ(second.attribute("id").value(), "1");
    EXPECT_STREQ(second.attribute("parent").value(), "0");
}

TEST_F(DrawioExportTest, NodesFollowCreationOrderThenEdges) {
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph_, layout_), doc);

    std::vector<std::string> ids;
    for (pugi::xml_node child : doc.child("mxGraphModel").child("root").children()) {
        ids.push_back(child.attribute("id").value());
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"0", "1", "vpc", "a", "b", "e1"}));
}

TEST_F(DrawioExportTest, NodeObjectCarriesLabelTitleStyleAndGeometry) {
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph_, layout_), doc);

    pugi::xml_node vpc = doc.select_node("//object[@id='vpc']").node();
    ASSERT_TRUE(vpc);
    EXPECT_STREQ(vpc.attribute("label").value(), "Main VPC");
    EXPECT_STREQ(vpc.attribute("vpc").value(), "Network");

    pugi::xml_node cell = vpc.child("mxCell");
    EXPECT_EQ(std::string(cell.attribute("style").value()), catalog_.resolve("vpc").style);
    EXPECT_STREQ(cell.attribute("vertex").value(), "1");
    EXPECT_STREQ(cell.attribute("parent").value(), "1");

    pugi::xml_node geometry = cell.child("mxGeometry");
    EXPECT_STREQ(geometry.attribute("x").value(), "-50");
    EXPECT_STREQ(geometry.attribute("y").value(), "-50");
    EXPECT_STREQ(geometry.attribute("height").value(), "100");
    EXPECT_STREQ(geometry.attribute("width").value(), "200");
    EXPECT_STREQ(geometry.attribute("as").value(), "geometry");
}

TEST_F(DrawioExportTest, ResourceTitleUsesNormalizedType) {
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph_, layout_), doc);

    pugi::xml_node a = doc.select_node("//object[@id='a']").node();
    EXPECT_STREQ(a.attribute("box40").value(), "EC2");
    EXPECT_STREQ(a.child("mxCell").attribute("style").value(), "shape=box40;");
    EXPECT_STREQ(a.child("mxCell").child("mxGeometry").attribute("x").value(), "-20");
}

TEST_F(DrawioExportTest, EdgeCellIsRelative) {
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph_, layout_), doc);

    pugi::xml_node edge = doc.select_node("//mxCell[@id='e1']").node();
    ASSERT_TRUE(edge);
    EXPECT_EQ(std::string(edge.attribute("style").value()), catalog_.edgeStyle().style);
    EXPECT_STREQ(edge.attribute("parent").value(), "1");
    EXPECT_STREQ(edge.attribute("source").value(), "a");
    EXPECT_STREQ(edge.attribute("target").value(), "b");
    EXPECT_STREQ(edge.attribute("edge").value(), "1");

    pugi::xml_node geometry = edge.child("mxGeometry");
    EXPECT_STREQ(geometry.attribute("relative").value(), "1");
    EXPECT_FALSE(geometry.attribute("x"));
}

TEST_F(DrawioExportTest, ReservedTypeNameOmitsTitle) {
    DiagramGraph graph;
    graph.addNode(NodeData{"n", "label", "Text", "Title", Point{}, true});
    LayoutResult layout = ContainmentLayout(catalog_).layout(graph);

    Logger::enableCapture(true);
    Logger::clearCapturedLogs();
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph, layout), doc);
    Logger::enableCapture(false);

    pugi::xml_node object = doc.select_node("//object[@id='n']").node();
    EXPECT_STREQ(object.attribute("label").value(), "Text");
    EXPECT_FALSE(Logger::getCapturedLogs("reserved attribute").empty());
}

TEST_F(DrawioExportTest, InvalidTypeNameOmitsTitle) {
    DiagramGraph graph;
    graph.addNode(NodeData{"g", "5G Core", "Core", "Title", Point{}, true});
    graph.addNode(NodeData{"h", "Arch_Amazon-EC2_48", "Web", "EC2", Point{}, true});
    LayoutResult layout = ContainmentLayout(catalog_).layout(graph);

    Logger::enableCapture(true);
    Logger::clearCapturedLogs();
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph, layout), doc);
    Logger::enableCapture(false);

    pugi::xml_node g = doc.select_node("//object[@id='g']").node();
    ASSERT_TRUE(g);
    EXPECT_STREQ(g.attribute("label").value(), "Core");
    EXPECT_FALSE(g.find_attribute([](pugi::xml_attribute a) {
        return std::string(a.value()) == "Title";
    }));
    EXPECT_FALSE(Logger::getCapturedLogs("not a valid attribute name").empty());

    pugi::xml_node h = doc.select_node("//object[@id='h']").node();
    EXPECT_STREQ(h.attribute("Arch_Amazon-EC2_48").value(), "EC2");
}

TEST_F(DrawioExportTest, SpecialCharactersSurviveInLabelsAndTitles) {
    const std::string label = "Web & <API> \"edge\"\nsecond line";
    const std::string title = "R&D <tier> \"1\"";

    DiagramGraph graph;
    graph.addNode(NodeData{"n", "box40", label, title, Point{}, true});
    LayoutResult layout = ContainmentLayout(catalog_).layout(graph);

    DrawioExport exporter(catalog_);
    std::string xml = exporter.exportToString(graph, layout);
    EXPECT_EQ(xml.find("<API>"), std::string::npos);

    pugi::xml_document doc;
    pugi::xml_parse_result result =
        doc.load_string(xml.c_str(), pugi::parse_default & ~pugi::parse_wconv_attribute);
    ASSERT_TRUE(result) << result.description();

    pugi::xml_node object = doc.select_node("//object[@id='n']").node();
    EXPECT_EQ(std::string(object.attribute("label").value()), label);
    EXPECT_EQ(std::string(object.attribute("box40").value()), title);
}

// --- Serialization ---

TEST_F(DrawioExportTest, RawOutputHasNoDeclarationOrNewlines) {
    DrawioExport exporter(catalog_);
    std::string xml = exporter.exportToString(graph_, layout_);

    EXPECT_EQ(xml.rfind("<mxGraphModel>", 0), 0u);
    EXPECT_EQ(xml.find('\n'), std::string::npos);
}

TEST_F(DrawioExportTest, OptionsAddIndentAndDeclaration) {
    DrawioExportOptions options;
    options.indent = true;
    options.xmlDeclaration = true;
    DrawioExport exporter(catalog_, options);
    std::string xml = exporter.exportToString(graph_, layout_);

    EXPECT_EQ(xml.rfind("<?xml", 0), 0u);
    EXPECT_NE(xml.find('\n'), std::string::npos);
}

TEST_F(DrawioExportTest, ExportIsDeterministic) {
    DrawioExport exporter(catalog_);
    EXPECT_EQ(exporter.exportToString(graph_, layout_), exporter.exportToString(graph_, layout_));
}

TEST_F(DrawioExportTest, MissingBoxIsLayoutError) {
    DrawioExport exporter(catalog_);
    EXPECT_THROW(exporter.exportToString(graph_, LayoutResult{}), LayoutError);
}

TEST_F(DrawioExportTest, ExportToFileWritesDocument) {
    auto path = std::filesystem::temp_directory_path() / "drawlink_export_test.drawio";
    DrawioExport exporter(catalog_);

    ASSERT_TRUE(exporter.exportToFile(graph_, layout_, path.string()));
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), exporter.exportToString(graph_, layout_));

    std::filesystem::remove(path);
    EXPECT_FALSE(exporter.exportToFile(graph_, layout_, "/nonexistent-dir/out.drawio"));
}

// --- Number formatting ---

TEST(DrawioExportFormatTest, FormatNumber) {
    EXPECT_EQ(DrawioExport::formatNumber(0.0), "0");
    EXPECT_EQ(DrawioExport::formatNumber(-0.0), "0");
    EXPECT_EQ(DrawioExport::formatNumber(43.0), "43");
    EXPECT_EQ(DrawioExport::formatNumber(-21.5), "-21.5");
    EXPECT_EQ(DrawioExport::formatNumber(0.1), "0.1");
}

TEST(DrawioExportFormatTest, FormatNumberNeverUsesExponent) {
    EXPECT_EQ(DrawioExport::formatNumber(100000.0), "100000");
    EXPECT_EQ(DrawioExport::formatNumber(-100000.0), "-100000");
    EXPECT_EQ(DrawioExport::formatNumber(200000.0), "200000");
    EXPECT_EQ(DrawioExport::formatNumber(3000000.0), "3000000");
    EXPECT_EQ(DrawioExport::formatNumber(120000.5), "120000.5");
    EXPECT_EQ(DrawioExport::formatNumber(1e-5), "0.00001");
}

TEST_F(DrawioExportTest, LargeContainerGeometryIsPlainDecimal) {
    DiagramRequest request;
    request.nodes.emplace_back("P", "vpc", "Far", "VPC", Point{0, 0});
    NodeDescriptor a("a", "resource", "A", "EC2", Point{99950, 0});
    a.image = "box40.svg";
    a.parent = "P";
    request.nodes.push_back(a);

    DiagramGraph graph = DiagramGraph::fromRequest(request);
    LayoutResult layout = ContainmentLayout(catalog_).layout(graph);
    DrawioExport exporter(catalog_);
    pugi::xml_document doc;
    parse(exporter.exportToString(graph, layout), doc);

    // right extent 99950 + 20 + 30 = 100000, mirrored around x = 0
    pugi::xml_node geometry = doc.select_node("//object[@id='P']/mxCell/mxGeometry").node();
    EXPECT_STREQ(geometry.attribute("width").value(), "200000");
}
