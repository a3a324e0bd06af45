#include "pipeforge/pipeline/matrix.hpp"
#include "pipeforge/pipeline/template.hpp"

#include <map>
#include <optional>
#include <string>

#include "gtest/gtest.h"

using namespace pipeforge;

TEST(TemplateTest, ReplacesKnownTokens) {
  const TemplateLookup lookup =
      [](std::string_view name) -> std::optional<std::string> {
    if (name == "matrix.os") {
      return "linux";
    }
    return std::nullopt;
  };
  EXPECT_EQ(render_template("build-${{ matrix.os }}.tar", lookup),
            "build-linux.tar");
  EXPECT_EQ(render_template("${{matrix.os}}/${{  matrix.os  }}", lookup),
            "linux/linux");
}

TEST(TemplateTest, UnknownAndUnterminatedTokensPassThrough) {
  const TemplateLookup none = [](std::string_view) {
    return std::optional<std::string>{};
  };
  EXPECT_EQ(render_template("a ${{ matrix.arch }} b", none),
            "a ${{ matrix.arch }} b");
  EXPECT_EQ(render_template("tail ${{ open", none), "tail ${{ open");
  EXPECT_EQ(render_template("cost $5 \\n", none), "cost $5 \\n");
}

TEST(TemplateTest, EscapedOpeningIsLiteral) {
  const TemplateLookup lookup = [](std::string_view) {
    return std::optional<std::string>{"X"};
  };
  EXPECT_EQ(render_template("\\${{ matrix.os }}", lookup), "${{ matrix.os }}");
}

TEST(TemplateTest, TokensAreListedInOrder) {
  const auto tokens =
      template_tokens("${{ matrix.os }}-${{ ref_name }}-\\${{ skipped }}");
  ASSERT_EQ(tokens.size(), 2U);
  EXPECT_EQ(tokens[0], "matrix.os");
  EXPECT_EQ(tokens[1], "ref_name");
  EXPECT_FALSE(has_template("plain text"));
}

TEST(MatrixTest, StageWithoutAxesYieldsOneJob) {
  auto stage = StageBuilder("lint").shell("lint", "make lint").build();
  auto jobs = expand_matrix(stage, 3);
  ASSERT_TRUE(jobs);
  ASSERT_EQ(jobs->size(), 1U);
  const auto &job = jobs->front();
  EXPECT_EQ(job.id, "lint");
  EXPECT_TRUE(job.qualifier.empty());
  EXPECT_TRUE(job.assignment.empty());
  EXPECT_EQ(job.stage_index, 3U);
  EXPECT_EQ(matrix_size(stage), 1U);
}

TEST(MatrixTest, CartesianProductInDeclarationOrder) {
  auto stage = StageBuilder("build")
                   .axis("os", {"linux", "macos"})
                   .axis("arch", {"x64", "arm64", "riscv"})
                   .shell("compile", "make ARCH=${{ matrix.arch }}")
                   .build();
  auto jobs = expand_matrix(stage);
  ASSERT_TRUE(jobs);
  ASSERT_EQ(jobs->size(), 6U);
  EXPECT_EQ(matrix_size(stage), 6U);

  // First axis varies slowest.
  EXPECT_EQ((*jobs)[0].qualifier, "os=linux,arch=x64");
  EXPECT_EQ((*jobs)[1].qualifier, "os=linux,arch=arm64");
  EXPECT_EQ((*jobs)[2].qualifier, "os=linux,arch=riscv");
  EXPECT_EQ((*jobs)[3].qualifier, "os=macos,arch=x64");
  EXPECT_EQ((*jobs)[5].id, "build[os=macos,arch=riscv]");
  for (std::size_t i = 0; i < jobs->size(); ++i) {
    EXPECT_EQ((*jobs)[i].instance, i);
  }
}

TEST(MatrixTest, ExpansionRendersMatrixTokens) {
  auto stage = StageBuilder("package")
                   .axis("os", {"ubuntu", "windows"})
                   .shell("pack ${{ matrix.os }}", "tar czf out-${{ matrix.os }}")
                   .env("TARGET", "${{ matrix.os }}")
                   .produces("bundle", "dist/${{ matrix.os }}.tgz")
                   .build();
  auto jobs = expand_matrix(stage);
  ASSERT_TRUE(jobs);
  ASSERT_EQ(jobs->size(), 2U);
  const auto &win = (*jobs)[1];
  EXPECT_EQ(win.steps.front().name, "pack windows");
  EXPECT_EQ(win.steps.front().param("run"), "tar czf out-windows");
  EXPECT_EQ(win.env.at("TARGET"), "windows");
  EXPECT_EQ(win.produces.front().path, "dist/windows.tgz");
  // The declaration itself is untouched.
  EXPECT_EQ(stage.produces.front().path, "dist/${{ matrix.os }}.tgz");
}

TEST(MatrixTest, ContextTokensAreLeftForLater) {
  auto stage = StageBuilder("release")
                   .axis("os", {"linux"})
                   .shell("upload", "upload ${{ ref_name }}-${{ matrix.os }}")
                   .build();
  auto jobs = expand_matrix(stage);
  ASSERT_TRUE(jobs);
  EXPECT_EQ(jobs->front().steps.front().param("run"),
            "upload ${{ ref_name }}-linux");
}

TEST(MatrixTest, ContextLookupRendersInTheSamePass) {
  const TemplateLookup context =
      [](std::string_view name) -> std::optional<std::string> {
    if (name == "ref") {
      return "refs/tags/v1.2.3";
    }
    return std::nullopt;
  };
  auto stage = StageBuilder("release")
                   .axis("os", {"linux", "${{ ref }}"})
                   .shell("upload", "echo '\\${{ ref }}' ${{ matrix.os }} "
                                    "${{ ref }}")
                   .build();
  auto jobs = expand_matrix(stage, 0, context);
  ASSERT_TRUE(jobs);
  ASSERT_EQ(jobs->size(), 2U);
  EXPECT_EQ((*jobs)[0].steps.front().param("run"),
            "echo '${{ ref }}' linux refs/tags/v1.2.3");
  // Substituted matrix values are not rendered again.
  EXPECT_EQ((*jobs)[1].steps.front().param("run"),
            "echo '${{ ref }}' ${{ ref }} refs/tags/v1.2.3");
}

TEST(MatrixTest, EmptyAxisIsRejected) {
  auto stage =
      StageBuilder("test").axis("os", {}).shell("t", "make test").build();
  auto jobs = expand_matrix(stage);
  ASSERT_FALSE(jobs);
  EXPECT_EQ(jobs.error(), make_error_code(Error::EmptyMatrixAxis));
  EXPECT_EQ(matrix_size(stage), 0U);
}

TEST(MatrixTest, MatrixLookupOnlyAnswersMatrixNames) {
  const auto lookup = matrix_lookup({{"os", "linux"}, {"arch", "x64"}});
  EXPECT_EQ(lookup("matrix.arch"), "x64");
  EXPECT_FALSE(lookup("matrix.python").has_value());
  EXPECT_FALSE(lookup("arch").has_value());
}

TEST(MatrixTest, QualifierAndJobIdHelpers) {
  EXPECT_EQ(make_qualifier({{"a", "1"}, {"b", "2"}}), "a=1,b=2");
  EXPECT_EQ(make_qualifier({}), "");
  EXPECT_EQ(make_job_id("test", ""), "test");
  EXPECT_EQ(make_job_id("test", "a=1"), "test[a=1]");
}
