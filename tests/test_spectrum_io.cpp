#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

#include "specclean/ContinuumNormalizer.hpp"
#include "specclean/Errors.hpp"
#include "specclean/ReportUtils.hpp"
#include "specclean/Spectrum.hpp"
#include "test_helpers.h"

using namespace specclean;
using specclean::test::TempFile;

TEST(SpectrumIoTest, LoadsFourColumnTable) {
    TempFile f("star.txt",
               "# λ [Å] flux σ bitmask\n"
               "15100.0 1.0 0.1 0\n"
               "  \t# λ sorted ascending\n"
               "15100.2 1.1 0.1 4096\n"
               "15100.4 0.9 0.2 1\n");
    const StarSpectrum s = load_star_ascii(f.path());
    ASSERT_EQ(s.size(), 3);
    EXPECT_DOUBLE_EQ(s.lambda[1], 15100.2);
    EXPECT_DOUBLE_EQ(s.flux[2], 0.9);
    EXPECT_DOUBLE_EQ(s.sigma[2], 0.2);
    EXPECT_EQ(s.bitmask, (Bitmask{0, 4096, 1}));
    EXPECT_NO_THROW(s.check_aligned());
}

TEST(SpectrumIoTest, ThreeColumnTableUsesLogGrid) {
    TempFile f("star3.txt",
               "1.0 0.1 0\n"
               "1.0 0.1 0\n");
    const StarSpectrum s = load_star_ascii(f.path(), 4.179, 6e-6);
    ASSERT_EQ(s.size(), 2);
    EXPECT_NEAR(s.lambda[0], std::pow(10.0, 4.179), 1e-9);
    EXPECT_NEAR(s.lambda[1], std::pow(10.0, 4.179 + 6e-6), 1e-9);
}

TEST(SpectrumIoTest, RejectsMalformedTables) {
    TempFile ragged("ragged.txt", "15100.0 1.0 0.1 0\n15100.2 1.0 0.1\n");
    EXPECT_THROW(load_star_ascii(ragged.path()), ShapeMismatchError);

    TempFile unsorted("unsorted.txt", "15100.2 1.0 0.1 0\n15100.0 1.0 0.1 0\n");
    EXPECT_THROW(load_star_ascii(unsorted.path()), UnsortedInputError);

    TempFile fractional("frac.txt", "15100.0 1.0 0.1 0.5\n");
    EXPECT_THROW(load_star_ascii(fractional.path()), std::runtime_error);

    EXPECT_THROW(load_star_ascii("/nonexistent/star.txt"), std::runtime_error);
}

TEST(SpectrumIoTest, CheckAlignedReportsLengths) {
    StarSpectrum s = specclean::test::make_clean_star();
    s.sigma.conservativeResize(10);
    try {
        s.check_aligned();
        FAIL() << "expected ShapeMismatchError";
    } catch (const ShapeMismatchError& e) {
        EXPECT_NE(std::string(e.what()).find("/10/"), std::string::npos);
    }
}

TEST(SpectrumIoTest, CsvMarksAnchors) {
    NormalizedSpectrum ns;
    ns.lambda = Vector::LinSpaced(3, 1.0, 3.0);
    ns.flux = Vector::Ones(3);
    ns.sigma = Vector::Constant(3, 0.5);
    ns.continuum = Vector::Constant(3, 2.0);
    ns.source_index = {10, 11, 12};
    ns.anchor_index = {11};

    std::ostringstream os;
    write_normalized_csv(os, ns);
    EXPECT_EQ(os.str(),
              "lambda,flux,sigma,continuum,anchor\n"
              "1,1,0.5,2,0\n"
              "2,1,0.5,2,1\n"
              "3,1,0.5,2,0\n");

    const std::string line = summary_line("star", ns);
    EXPECT_NE(line.find("3 pixels"), std::string::npos);
    EXPECT_NE(line.find("1 anchors"), std::string::npos);
}
