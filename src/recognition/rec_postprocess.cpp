#include "recognition/rec_postprocess.h"
#include "common/logger.hpp"
#include <fstream>
#include <numeric>

namespace picmod {

CTCDecoder::CTCDecoder(const std::string& dict_path, bool use_space_char) {
    if (!loadDictionary(dict_path, use_space_char)) {
        LOG_ERROR("Failed to load dictionary from: {}", dict_path);
    }
}

CTCDecoder::CTCDecoder(const std::vector<std::string>& characters, bool use_space_char) {
    character_dict_.push_back("blank");
    character_dict_.insert(character_dict_.end(), characters.begin(), characters.end());
    if (use_space_char) {
        character_dict_.push_back(" ");
    }
}

bool CTCDecoder::loadDictionary(const std::string& dict_path, bool use_space_char) {
    std::ifstream file(dict_path, std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open dictionary file: {}", dict_path);
        return false;
    }

    // blank 字符作为索引0
    character_dict_.clear();
    character_dict_.push_back("blank");

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            character_dict_.push_back(line);
        }
    }

    if (use_space_char) {
        character_dict_.push_back(" ");
    }

    LOG_INFO("Loaded dictionary with {} characters (including blank)", character_dict_.size());
    return character_dict_.size() > 1;
}

std::pair<std::string, float> CTCDecoder::decode(const float* data, int time_steps, int num_classes) const {
    if (!data || time_steps <= 0) {
        return {"", 0.0f};
    }

    if (num_classes != static_cast<int>(character_dict_.size())) {
        LOG_ERROR("Dictionary size mismatch: model={}, dict={}", num_classes, character_dict_.size());
        return {"", 0.0f};
    }

    // Argmax - 每个时间步的最大概率索引
    std::vector<int> pred_indices;
    std::vector<float> pred_probs;
    pred_indices.reserve(time_steps);
    pred_probs.reserve(time_steps);

    for (int t = 0; t < time_steps; t++) {
        const float* step = data + static_cast<size_t>(t) * num_classes;
        int max_idx = 0;
        float max_prob = step[0];
        for (int c = 1; c < num_classes; c++) {
            if (step[c] > max_prob) {
                max_prob = step[c];
                max_idx = c;
            }
        }
        pred_indices.push_back(max_idx);
        pred_probs.push_back(max_prob);
    }

    return decodeSequence(pred_indices, pred_probs);
}

std::pair<std::string, float> CTCDecoder::decodeSequence(const std::vector<int>& indices,
                                                         const std::vector<float>& probs) const {
    if (indices.empty() || indices.size() != probs.size()) {
        return {"", 0.0f};
    }

    std::string text;
    std::vector<float> confidences;

    for (size_t i = 0; i < indices.size(); i++) {
        // 连续相同的字符只保留一个
        if (i > 0 && indices[i] == indices[i - 1]) {
            continue;
        }
        int idx = indices[i];
        if (idx == blank_index_) {
            continue;
        }
        if (idx < 0 || idx >= static_cast<int>(character_dict_.size())) {
            LOG_WARN("Character index {} out of bounds (dict size: {})", idx, character_dict_.size());
            continue;
        }
        text += character_dict_[idx];
        confidences.push_back(probs[i]);
    }

    float avg_confidence = 0.0f;
    if (!confidences.empty()) {
        avg_confidence = std::accumulate(confidences.begin(), confidences.end(), 0.0f)
                         / static_cast<float>(confidences.size());
    }

    return {text, avg_confidence};
}

} // namespace picmod
