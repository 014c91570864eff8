/**
 * @file json.cpp
 * @brief nlohmann::json conversions.
 */

#include <unravel/json.hpp>

namespace unravel {

void to_json(nlohmann::json& j, const AttemptSummary& attempt) {
    j = nlohmann::json{{"text_snippet", attempt.text_snippet}, {"decoder", attempt.decoder}};
}

void to_json(nlohmann::json& j, const SessionExport& record) {
    j = nlohmann::json{
        {"original_text", record.original_text},
        {"final_text", record.final_text},
        {"encoding_chain", record.encoding_chain},
        {"iterations", record.iterations},
        {"max_iterations", record.max_iterations},
        {"complete", record.complete},
        {"status", record.status},
        {"reason", record.reason},
        {"history", record.history},
        {"confidence_scores", record.confidence_scores},
        {"attempted_decodings", record.attempted},
        {"attempted_count", record.attempted_count},
    };
}

void to_json(nlohmann::json& j, const RunResult& result) {
    nlohmann::json chain = nlohmann::json::array();
    for (Encoding encoding : result.encoding_chain) {
        chain.push_back(std::string(encoding_name(encoding)));
    }

    j = nlohmann::json{
        {"success", result.success},
        {"status", session_status_name(result.status)},
        {"original_text", result.original_text},
        {"final_text", result.final_text},
        {"encoding_chain", chain},
        {"iterations", result.iterations},
        {"reason", result.reason},
        {"confidence_scores", result.confidence_scores},
        {"history", result.history},
    };
}

void to_json(nlohmann::json& j, const TextAnalysis& analysis) {
    j = nlohmann::json{
        {"text", analysis.text},
        {"length", analysis.length},
        {"charset", charset_name(analysis.charset)},
        {"entropy", analysis.entropy},
        {"printable_ratio", analysis.printable_ratio},
        {"has_padding", analysis.has_padding},
        {"contains_url", analysis.contains_url},
        {"contains_flag", analysis.contains_flag},
        {"hash_type", analysis.hash_type == HashType::None
                          ? nlohmann::json(nullptr)
                          : nlohmann::json(hash_type_name(analysis.hash_type))},
    };
}

std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace unravel
