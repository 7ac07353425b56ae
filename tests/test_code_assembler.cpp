#include <gtest/gtest.h>
#include "code_assembler.hpp"

TEST(CodeAssembler, PreambleComesFirst) {
    std::string script = assemble_script("print('hi')\n");
    const std::string& pre = instrumentation_preamble();
    ASSERT_EQ(script.compare(0, pre.size(), pre), 0);
    EXPECT_EQ(script.substr(pre.size()), "print('hi')\n");
}

TEST(CodeAssembler, PreambleForcesHeadlessBackend) {
    const std::string& pre = instrumentation_preamble();
    EXPECT_NE(pre.find("use('Agg')"), std::string::npos);
    EXPECT_NE(pre.find("savefig('plot.png')"), std::string::npos);
    EXPECT_NE(pre.find("except ImportError"), std::string::npos);
    EXPECT_EQ(pre.back(), '\n');
}

TEST(CodeAssembler, UserCodeIsVerbatim) {
    std::string code = "x = 1\r\n\tif x:\n  print('\\u00e9')";
    EXPECT_EQ(assemble_script(code).substr(instrumentation_preamble().size()), code);
}

TEST(CodeAssembler, FiltersInstrumentationLines) {
    std::string raw = "Traceback (most recent call last):\n"
                      "[Plot saved to plot.png]\n"
                      "ZeroDivisionError: division by zero\n"
                      "[Error saving plot: disk full]\n";
    EXPECT_EQ(filter_instrumentation_lines(raw),
              "Traceback (most recent call last):\nZeroDivisionError: division by zero");
    EXPECT_EQ(filter_instrumentation_lines(""), "");
    EXPECT_EQ(filter_instrumentation_lines("[Plot saved to plot.png]\n"), "");
}
