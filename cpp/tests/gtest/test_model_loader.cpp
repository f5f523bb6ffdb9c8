// =============================================================================
// Model File Loader Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polarity/io/model_loader.hpp"
#include "polarity/engine_state.hpp"
#include "polarity/error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace polarity;
namespace fs = std::filesystem;

class ModelLoaderTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("polarity_model_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        fs::path p = dir / name;
        std::ofstream out(p);
        out << content;
        return p;
    }

    static std::string vector_row(const std::string& key, int first_semantic, int last_context) {
        std::string row = key;
        for (int i = 0; i < constants::SEMANTIC_DIM; ++i) {
            row += " " + std::to_string(i == 0 ? first_semantic : 0);
        }
        for (int i = 0; i < constants::CONTEXT_DIM; ++i) {
            row += " " + std::to_string(i == constants::CONTEXT_DIM - 1 ? last_context : 0);
        }
        return row + "\n";
    }
};

TEST_F(ModelLoaderTest, ParseVocabularyWithComments) {
    std::istringstream in(
        "# id word sentiment flags category weight domain secondary influence\n"
        "0 good 4 5 2 8 0 0 1\n"
        "\n"
        "1\tbad\t-4\t2\t2\t8\t0\t0\t1   # trailing comment\n");

    VocabularyBatch batch = io::parse_vocabulary(in);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch.words[1], "bad");
    EXPECT_EQ(batch.sentiments[1], -4);
    EXPECT_EQ(batch.flags[0], 5);
    EXPECT_EQ(batch.weights[0], 8u);
    EXPECT_TRUE(batch.domain_strengths.empty());
}

TEST_F(ModelLoaderTest, ParseVocabularyWithStrength) {
    std::istringstream in("3 bond 1 8 7 5 2 6 2 75\n");
    VocabularyBatch batch = io::parse_vocabulary(in);
    ASSERT_EQ(batch.domain_strengths.size(), 1u);
    EXPECT_EQ(batch.domain_strengths[0], 75u);
    EXPECT_EQ(batch.domain_relevance[0], 2u);
    EXPECT_EQ(batch.secondary_categories[0], 6);
}

TEST_F(ModelLoaderTest, ParseVocabularyErrors) {
    std::istringstream short_row("0 good 4 5\n");
    EXPECT_THROW(io::parse_vocabulary(short_row), IOError);

    std::istringstream not_number("0 good four 5 2 8 0 0 1\n");
    EXPECT_THROW(io::parse_vocabulary(not_number), IOError);

    std::istringstream mixed("0 a 1 0 0 1 0 0 1\n1 b 1 0 0 1 0 0 1 50\n");
    try {
        io::parse_vocabulary(mixed);
        FAIL() << "mixed column counts should be rejected";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PARSE_FAILED);
        EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos);
    }
}

TEST_F(ModelLoaderTest, ParseEmbeddingsAndClassWeights) {
    std::istringstream emb(vector_row("4", 1200, -300));
    auto rows = io::parse_embeddings(emb);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, 4u);
    EXPECT_EQ(rows[0].semantic(0), 1200);
    EXPECT_EQ(rows[0].context(constants::CONTEXT_DIM - 1), -300);

    std::istringstream cw(vector_row("6", 1000, 0));
    auto weights = io::parse_class_weights(cw);
    ASSERT_EQ(weights.size(), 1u);
    EXPECT_EQ(weights[0].cls, 6);

    std::istringstream truncated("4 1 2 3\n");
    EXPECT_THROW(io::parse_embeddings(truncated), IOError);
}

TEST_F(ModelLoaderTest, ParseDomains) {
    std::istringstream in("2 5 0 30 0 0 0 -10 0\n");
    auto rows = io::parse_domains(in);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].domain, 2);
    EXPECT_EQ(rows[0].modifier.intensity, 5u);
    EXPECT_EQ(rows[0].modifier.bias[1], 30);
    EXPECT_EQ(rows[0].modifier.bias[5], -10);
}

TEST_F(ModelLoaderTest, LoadModelAppliesEveryFile) {
    io::ModelPaths paths;
    paths.vocabulary = write("vocab.txt", "0 good 4 0 0 8 0 0 1\n1 fine 1 0 0 2 0 0 1\n");
    paths.embeddings = write("emb.txt", vector_row("0", 1000, 0));
    paths.class_weights = write("classes.txt", vector_row("5", 1000, 0));
    paths.domains = write("domains.txt", "3 9 1 1 1 1 1 1 1\n");

    EngineState state;
    io::load_model(state, paths);

    EXPECT_EQ(state.vocabulary.size(), 2u);
    EXPECT_EQ(state.vocabulary.semantic(0)(0), 1000);
    EXPECT_EQ(state.vocabulary.class_semantic(5)(0), 1000);
    EXPECT_EQ(state.domains.modifier(3).intensity, 9u);
}

TEST_F(ModelLoaderTest, FailedLoadLeavesStateUntouched) {
    EngineState state;
    io::ModelPaths good;
    good.vocabulary = write("vocab.txt", "0 good 4 0 0 8 0 0 1\n");
    io::load_model(state, good);

    io::ModelPaths bad;
    bad.vocabulary = write("vocab2.txt", "0 better 9 0 0 8 0 0 1\n1 worse -9 0 0 8 0 0 1\n");
    // intensity above 100 fails after the vocabulary was staged
    bad.domains = write("bad_domains.txt", "1 500 0 0 0 0 0 0 0\n");

    EXPECT_THROW(io::load_model(state, bad), ValidationError);
    EXPECT_EQ(state.vocabulary.size(), 1u);
    EXPECT_EQ(state.vocabulary.word(0), "good");
}

TEST_F(ModelLoaderTest, MissingFile) {
    try {
        io::load_vocabulary(dir / "does_not_exist.txt");
        FAIL() << "missing file should throw";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
    }
}
