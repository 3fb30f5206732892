#include "aibridge/shell/code_poster.hpp"

#include <utility>

namespace aibridge::shell {

CodePoster::CodePoster(InputEditor& editor, CodePredictor* predictor, std::shared_ptr<core::logging::Logger> logger)
    : editor_(editor), predictor_(predictor), logger_(std::move(logger)) {
}

void CodePoster::post(const core::ipc::PostCodeMessage& message) {
    const auto& blocks = message.code_blocks;
    if (blocks.empty() || has_pending()) {
        if (logger_) {
            logger_->debug("[code] ignoring posting of {} block(s)", blocks.size());
        }
        return;
    }

    // The editor and the predictor are host code and are never called under mutex_.
    PendingPost post;
    if (blocks.size() == 1) {
        post.code = blocks.front();
    } else if (predictor_ && predictor_->try_process_for_prediction(blocks, post.candidates) &&
               !post.candidates.empty()) {
        post.code = post.candidates.front().code;
    } else {
        post.candidates.clear();
        post.code = join_blocks(blocks);
    }

    if (editor_.is_input_ready()) {
        editor_.revert_pending_input();
        insert(post);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_) {
        return;
    }
    if (logger_) {
        logger_->debug("[code] input line busy, deferring insertion");
    }
    pending_ = std::move(post);
}

void CodePoster::on_idle() {
    std::optional<PendingPost> post;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        post.swap(pending_);
    }
    if (post) {
        insert(*post);
    }
}

bool CodePoster::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

std::string CodePoster::join_blocks(const std::vector<std::string>& code_blocks) {
    std::string joined;
    for (std::size_t i = 0; i < code_blocks.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined.append(code_blocks[i]).push_back('\n');
    }
    return joined;
}

void CodePoster::insert(const PendingPost& post) {
    editor_.insert_text(post.code);
    if (predictor_) {
        predictor_->set_candidates(post.candidates);
    }
}

}  // namespace aibridge::shell
