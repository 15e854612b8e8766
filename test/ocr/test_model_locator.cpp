/**
 * @file test_model_locator.cpp
 * @brief 本地模型查找测试
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "ocr/model_locator.h"

using namespace picmod;
namespace fs = std::filesystem;

class ModelLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("picmod_models_" + std::to_string(counter_++) + "_" +
                 std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void touch(const fs::path& relative) {
        fs::path full = root_ / relative;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << "x";
    }

    fs::path root_;
    static int counter_;
};

int ModelLocatorTest::counter_ = 0;

TEST_F(ModelLocatorTest, EmptyRoot_Incomplete) {
    ModelLocator locator(root_.string());
    EXPECT_FALSE(locator.locate().complete());
}

/**
 * @brief 标准目录结构 models/paddleocr/{det,rec,cls}
 */
TEST_F(ModelLocatorTest, ModelsDir_StandardLayout) {
    touch("models/paddleocr/det/det_v5_640.dxnn");
    touch("models/paddleocr/rec/rec_v5_ratio_10.dxnn");
    touch("models/paddleocr/rec/ppocr_keys_dict.txt");
    touch("models/paddleocr/cls/textline_ori.dxnn");

    ModelPaths paths = ModelLocator(root_.string()).locate();

    ASSERT_TRUE(paths.complete());
    EXPECT_EQ(fs::path(paths.detDir), root_ / "models/paddleocr/det");
    EXPECT_EQ(fs::path(paths.recDir), root_ / "models/paddleocr/rec");
    EXPECT_EQ(fs::path(paths.clsDir), root_ / "models/paddleocr/cls");
    EXPECT_EQ(fs::path(paths.dictPath), root_ / "models/paddleocr/rec/ppocr_keys_dict.txt");
}

TEST_F(ModelLocatorTest, ModelsDir_MissingDictionary) {
    touch("models/paddleocr/det/a.dxnn");
    touch("models/paddleocr/rec/b.dxnn");

    EXPECT_FALSE(ModelLocator(root_.string()).locate().complete());
}

/**
 * @brief .paddlex 递归查找，按目录名或父目录名判定类型；优先于 models/
 */
TEST_F(ModelLocatorTest, Paddlex_NestedAndPreferred) {
    touch(".paddlex/official_models/PP-OCRv5_server_det/inference.dxnn");
    touch(".paddlex/official_models/rec/v5/inference.dxnn");
    touch(".paddlex/official_models/rec/v5/en_dict.txt");
    touch("models/paddleocr/det/a.dxnn");
    touch("models/paddleocr/rec/b.dxnn");
    touch("models/paddleocr/rec/dict.txt");

    ModelPaths paths = ModelLocator(root_.string()).locate();

    ASSERT_TRUE(paths.complete());
    EXPECT_EQ(fs::path(paths.detDir), root_ / ".paddlex/official_models/PP-OCRv5_server_det");
    EXPECT_EQ(fs::path(paths.recDir), root_ / ".paddlex/official_models/rec/v5");
    EXPECT_EQ(fs::path(paths.dictPath), root_ / ".paddlex/official_models/rec/v5/en_dict.txt");
    EXPECT_TRUE(paths.clsDir.empty());
}

/**
 * @brief 识别目录里没有字典时回退到 .paddlex 根目录
 */
TEST_F(ModelLocatorTest, Paddlex_DictionaryAtBase) {
    touch(".paddlex/det/m.dxnn");
    touch(".paddlex/rec/m.dxnn");
    touch(".paddlex/keys_dict.txt");

    ModelPaths paths = ModelLocator(root_.string()).locate();

    ASSERT_TRUE(paths.complete());
    EXPECT_EQ(fs::path(paths.dictPath), root_ / ".paddlex/keys_dict.txt");
}

TEST_F(ModelLocatorTest, Paddlex_IncompleteFallsBackToModelsDir) {
    touch(".paddlex/det/m.dxnn");
    touch("models/paddleocr/det/a.dxnn");
    touch("models/paddleocr/rec/b.dxnn");
    touch("models/paddleocr/rec/dict.txt");

    ModelPaths paths = ModelLocator(root_.string()).locate();

    ASSERT_TRUE(paths.complete());
    EXPECT_EQ(fs::path(paths.detDir), root_ / "models/paddleocr/det");
}

TEST_F(ModelLocatorTest, ListModelFiles_SortedAndFiltered) {
    touch("m/b_ratio_5.dxnn");
    touch("m/a_ratio_3.DXNN");
    touch("m/readme.md");

    auto files = ModelLocator::listModelFiles((root_ / "m").string());

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(fs::path(files[0]).filename(), "a_ratio_3.DXNN");
    EXPECT_EQ(fs::path(files[1]).filename(), "b_ratio_5.dxnn");
    EXPECT_TRUE(ModelLocator::hasModelFile(root_ / "m"));
    EXPECT_FALSE(ModelLocator::hasModelFile(root_ / "missing"));
}
