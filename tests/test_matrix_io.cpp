#include "DepInferExceptions.h"
#include "MatrixIO.h"
#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace {
NamedMatrix parse(const std::string& text, char delimiter = ',') {
    std::istringstream in(text);
    return MatrixIO::readNamedMatrix(in, delimiter, "inline");
}
} // namespace

TEST(MatrixIO, ReadsNamedMatrixWithMissingCells) {
    const NamedMatrix m = parse("drug,EGFR,\"BRAF, V600E\",MTOR\n"
                                "erlotinib,1e-9,NA,2.5e-6\r\n"
                                "\n"
                                "\"vemurafenib\",,3.1e-8, 7e-7 \n");
    ASSERT_EQ(m.rowCount(), 2u);
    ASSERT_EQ(m.colCount(), 3u);
    EXPECT_EQ(m.colNames, (std::vector<std::string>{"EGFR", "BRAF, V600E", "MTOR"}));
    EXPECT_EQ(m.rowNames, (std::vector<std::string>{"erlotinib", "vemurafenib"}));
    EXPECT_DOUBLE_EQ(m.at(0, 0), 1e-9);
    EXPECT_TRUE(std::isnan(m.at(0, 1)));
    EXPECT_TRUE(std::isnan(m.at(1, 0)));
    EXPECT_DOUBLE_EQ(m.at(1, 2), 7e-7);
    EXPECT_TRUE(m.hasMissing());
    EXPECT_NO_THROW(m.validateShape("inline"));
}

TEST(MatrixIO, HonoursDelimiterAndBom) {
    const NamedMatrix m = parse("\xEF\xBB\xBF\tS1\tS2\nd1\t0.5\t-1\nd2\t2\t3", '\t');
    EXPECT_EQ(m.colNames, (std::vector<std::string>{"S1", "S2"}));
    EXPECT_DOUBLE_EQ(m.at(0, 1), -1.0);
    EXPECT_DOUBLE_EQ(m.at(1, 0), 2.0);
}

TEST(MatrixIO, RejectsMalformedInput) {
    EXPECT_THROW(parse(""), DepInfer::IOException);
    EXPECT_THROW(parse("drug\nd1\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,B\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,B\nd1,1\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,B\nd1,1,strong\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,B\nd1,1,2x\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,A\nd1,1,2\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,B\nd1,1,2\nd1,3,4\n"), DepInfer::IOException);
    EXPECT_THROW(parse("drug,A,B\nd1,\"1,2\n"), DepInfer::IOException);
    EXPECT_THROW(MatrixIO::readNamedMatrix(testing::TempDir() + "no_such_matrix.csv"), DepInfer::IOException);
}

TEST(MatrixIO, ErrorsCarrySourceAndLine) {
    try {
        parse("drug,A\nd1,1\nd2,oops\n");
        FAIL() << "expected an IO error";
    } catch (const DepInfer::IOException& e) {
        EXPECT_NE(std::string(e.what()).find("inline:3"), std::string::npos);
    }
}

TEST(MatrixIO, ReadsFromDisk) {
    const std::string path = testing::TempDir() + "depinfer_matrix.csv";
    {
        std::ofstream out(path);
        out << ",P1,P2\nd1,1,2\nd2,3,4\n";
    }
    const NamedMatrix m = MatrixIO::readNamedMatrix(path);
    EXPECT_EQ(m.rowNames, (std::vector<std::string>{"d1", "d2"}));
    EXPECT_DOUBLE_EQ(m.at(1, 1), 4.0);
}

TEST(MatrixIO, AlignRowsFollowsAffinityOrder) {
    const NamedMatrix x = parse("drug,P1\na,1\nb,2\nc,3\n");
    const NamedMatrix y = parse("drug,S1,S2\nc,30,31\na,10,11\nb,20,21\n");
    const NamedMatrix aligned = MatrixIO::alignRows(x, y);
    EXPECT_EQ(aligned.rowNames, x.rowNames);
    EXPECT_DOUBLE_EQ(aligned.at(0, 0), 10.0);
    EXPECT_DOUBLE_EQ(aligned.at(2, 1), 31.0);

    const NamedMatrix other = parse("drug,S1\na,1\nb,2\nz,3\n");
    EXPECT_THROW(MatrixIO::alignRows(x, other), DepInfer::ValidationException);
    const NamedMatrix shorter = parse("drug,S1\na,1\nb,2\n");
    EXPECT_THROW(MatrixIO::alignRows(x, shorter), DepInfer::ValidationException);
}
