#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aibridge/core/ipc/protocol.hpp"
#include "aibridge/core/logging/logger.hpp"

namespace aibridge::shell {

struct PredictionCandidate {
    std::string code;
};

/**
 * @brief The host's line editor, as seen by code posting.
 */
class InputEditor {
public:
    virtual ~InputEditor() = default;

    // True while the editor is waiting for user input.
    [[nodiscard]] virtual bool is_input_ready() const = 0;
    virtual void insert_text(std::string_view text) = 0;
    virtual void revert_pending_input() = 0;
};

/**
 * @brief Optional heuristic that merges near-duplicate blocks into ranked alternatives.
 */
class CodePredictor {
public:
    virtual ~CodePredictor() = default;

    virtual bool try_process_for_prediction(const std::vector<std::string>& code_blocks,
                                            std::vector<PredictionCandidate>& candidates) = 0;
    virtual void set_candidates(const std::vector<PredictionCandidate>& candidates) = 0;
};

/**
 * @brief Inserts posted code into the input line, or keeps one posting
 * pending until the host reports it is idle.
 */
class CodePoster {
public:
    CodePoster(InputEditor& editor, CodePredictor* predictor = nullptr,
               std::shared_ptr<core::logging::Logger> logger = nullptr);

    // PostCode handler. Ignored while a previous posting is still pending.
    void post(const core::ipc::PostCodeMessage& message);

    // Called by the host when its input line becomes idle.
    void on_idle();

    [[nodiscard]] bool has_pending() const;

    // Each block followed by '\n', blocks separated by one more '\n'.
    [[nodiscard]] static std::string join_blocks(const std::vector<std::string>& code_blocks);

private:
    struct PendingPost {
        std::string code;
        std::vector<PredictionCandidate> candidates;
    };

    void insert(const PendingPost& post);

    InputEditor& editor_;
    CodePredictor* predictor_;
    std::shared_ptr<core::logging::Logger> logger_;

    mutable std::mutex mutex_;
    std::optional<PendingPost> pending_;
};

}  // namespace aibridge::shell
