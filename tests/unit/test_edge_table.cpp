#include <gtest/gtest.h>
#include "io/edge_table.hpp"
#include <sstream>

using namespace fcg;

// ==========================================
// Line Splitting Tests
// ==========================================

TEST(DelimitedLineTest, QuotedFieldKeepsDelimiter) {
    auto fields = split_delimited_line("M1,\"(1, 2)\",0.5", ',');
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[1], "(1, 2)");
}

TEST(DelimitedLineTest, DoubledQuoteEscapes) {
    auto fields = split_delimited_line("\"say \"\"hi\"\"\",x", ',');
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0], "say \"hi\"");
}

TEST(DelimitedLineTest, EmptyTrailingField) {
    auto fields = split_delimited_line("a,b,", ',');
    EXPECT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[2], "");
}

TEST(DelimitedLineTest, DetectsDelimiter) {
    EXPECT_EQ(detect_delimiter("Animal,Neuron Pair,Mean Edge Weight"), ',');
    EXPECT_EQ(detect_delimiter("Animal;Neuron Pair;Mean Edge Weight"), ';');
    EXPECT_EQ(detect_delimiter("Animal\tNeuron Pair\tMean Edge Weight"), '\t');
    // Commas inside quotes do not count
    EXPECT_EQ(detect_delimiter("\"a,b,c\"\t\"d\""), '\t');
}

// ==========================================
// Reader Tests
// ==========================================

TEST(EdgeTableReaderTest, ReadsCsvWithAnimalColumn) {
    std::istringstream in(
        "Animal,Neuron Pair,Mean Edge Weight\n"
        "M1,\"(1, 2)\",0.5\n"
        "M1,\"(2, 3)\",0.8\n"
        "M2,\"(1, 3)\",0.1\n");

    EdgeTable table = EdgeTableReader().parse(in);
    EXPECT_TRUE(table.has_animal_column);
    EXPECT_EQ(table.delimiter, ',');
    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_EQ(table.rows[0].animal, "M1");
    EXPECT_EQ(table.rows[0].pair, "(1, 2)");
    EXPECT_EQ(table.rows[0].weight, "0.5");
    EXPECT_EQ(table.rows[2].row_number, 3u);
}

TEST(EdgeTableReaderTest, AnimalColumnIsOptional) {
    std::istringstream in(
        "Neuron Pair\tMean Edge Weight\n"
        "(1, 2)\t0.5\n");

    EdgeTable table = EdgeTableReader().parse(in);
    EXPECT_FALSE(table.has_animal_column);
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_TRUE(table.rows[0].animal.empty());
}

TEST(EdgeTableReaderTest, ColumnsMatchCaseInsensitively) {
    std::istringstream in(
        "# exported connectivity\n"
        "\n"
        "mean edge weight;NEURON PAIR\r\n"
        "0.25;(4, 5)\r\n"
        "\n"
        "# trailing comment\n");

    EdgeTable table = EdgeTableReader().parse(in);
    EXPECT_EQ(table.delimiter, ';');
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].pair, "(4, 5)");
    EXPECT_EQ(table.rows[0].weight, "0.25");
}

TEST(EdgeTableReaderTest, CustomColumnNames) {
    EdgeTableColumns columns;
    columns.animal = "Mouse";
    columns.pair = "Pair";
    columns.weight = "Corr";

    std::istringstream in("Mouse,Pair,Corr\nA,\"(1, 2)\",0.9\n");
    EdgeTable table = EdgeTableReader(columns).parse(in);
    EXPECT_TRUE(table.has_animal_column);
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].animal, "A");
}

TEST(EdgeTableReaderTest, MissingRequiredColumn) {
    std::istringstream in("Animal,Neuron Pair\nM1,\"(1, 2)\"\n");
    EXPECT_THROW(EdgeTableReader().parse(in), EdgeTableError);
}

TEST(EdgeTableReaderTest, RaggedRow) {
    std::istringstream in(
        "Animal,Neuron Pair,Mean Edge Weight\n"
        "M1,\"(1, 2)\"\n");
    EXPECT_THROW(EdgeTableReader().parse(in), EdgeTableError);
}

TEST(EdgeTableReaderTest, EmptyInput) {
    std::istringstream in("# nothing here\n\n");
    EXPECT_THROW(EdgeTableReader().parse(in), EdgeTableError);
}

TEST(EdgeTableReaderTest, MissingFile) {
    EXPECT_THROW(EdgeTableReader().read("/nonexistent/edges.csv"), EdgeTableError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
