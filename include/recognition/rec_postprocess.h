#pragma once

#include <string>
#include <utility>
#include <vector>

namespace picmod {

/**
 * @brief CTC解码器 - 用于文本识别后处理
 *
 * 功能:
 * 1. CTC解码 (去重复 + 去blank)
 * 2. 字符索引转文本
 * 3. 置信度计算
 *
 * Index 0 is the blank; dictionary entries follow in file order, plus a
 * trailing space when use_space_char is set.
 */
class CTCDecoder {
public:
    CTCDecoder() = default;

    /**
     * @brief 从字典文件构造
     * @param dict_path 字符字典路径（UTF-8，每行一个字符）
     * @param use_space_char 是否追加空格字符
     */
    explicit CTCDecoder(const std::string& dict_path, bool use_space_char = true);

    /**
     * @brief 从字符列表构造（不含blank）
     */
    explicit CTCDecoder(const std::vector<std::string>& characters, bool use_space_char = true);

    /**
     * @brief 解码CTC输出
     * @param data 概率矩阵 [time_steps, num_classes]，行优先
     * @return pair<文本, 平均置信度>；类别数与字典不符时返回空文本
     */
    std::pair<std::string, float> decode(const float* data, int time_steps, int num_classes) const;

    /**
     * @brief 对argmax序列做CTC合并
     */
    std::pair<std::string, float> decodeSequence(const std::vector<int>& indices,
                                                 const std::vector<float>& probs) const;

    size_t getDictSize() const { return character_dict_.size(); }

    bool loadDictionary(const std::string& dict_path, bool use_space_char);

private:
    std::vector<std::string> character_dict_;
    int blank_index_ = 0;
};

} // namespace picmod
