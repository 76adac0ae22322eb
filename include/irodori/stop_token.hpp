/**
 * @file stop_token.hpp
 * @brief 協調的キャンセル（期限 + 停止フラグ）
 */
#ifndef IRODORI_STOP_TOKEN_HPP
#define IRODORI_STOP_TOKEN_HPP

#include <atomic>
#include <chrono>

namespace irodori {

/**
 * @brief 探索中断の判定
 *
 * 壁時計の期限と停止フラグ（シグナルハンドラやバッチ停止から設定される外部の
 * フラグと、探索器自身の stop() フラグ）をまとめたもの。探索側がノード展開・ライン推論ごとに stop_requested() を
 * ポーリングし、自分で巻き戻って戻る。
 */
class StopToken {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief 期限なし・フラグなし
     */
    StopToken() = default;

    /**
     * @param deadline 期限
     * @param flag 外部の停止フラグ（nullptr 可）
     * @param local_flag 所有者自身の停止フラグ（nullptr 可）
     */
    StopToken(clock::time_point deadline, const std::atomic<bool>* flag,
              const std::atomic<bool>* local_flag = nullptr)
        : has_deadline_(true), deadline_(deadline), flag_(flag), local_flag_(local_flag) {}

    explicit StopToken(const std::atomic<bool>* flag)
        : flag_(flag) {}

    /**
     * @brief どちらかの停止フラグが立ったか
     */
    bool cancelled() const {
        return (flag_ != nullptr && flag_->load(std::memory_order_relaxed)) ||
               (local_flag_ != nullptr && local_flag_->load(std::memory_order_relaxed));
    }

    /**
     * @brief 期限を過ぎたか
     */
    bool expired() const {
        return has_deadline_ && clock::now() >= deadline_;
    }

    /**
     * @brief 探索を打ち切るべきか
     */
    bool stop_requested() const { return cancelled() || expired(); }

private:
    bool has_deadline_ = false;
    clock::time_point deadline_{};
    const std::atomic<bool>* flag_ = nullptr;
    const std::atomic<bool>* local_flag_ = nullptr;
};

} // namespace irodori

#endif // IRODORI_STOP_TOKEN_HPP
