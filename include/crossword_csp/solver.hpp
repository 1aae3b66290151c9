/**
 * @file solver.hpp
 * @brief クロスワードCSPソルバー（AC-3 前処理 + MRV/LCV バックトラック）
 */
#ifndef CROSSWORD_CSP_SOLVER_HPP
#define CROSSWORD_CSP_SOLVER_HPP

#include "crossword_csp/assignment.hpp"
#include "crossword_csp/domain_store.hpp"
#include "crossword_csp/puzzle.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>

namespace crossword_csp {

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと探索を継続、falseで停止
 */
using AssignmentCallback = std::function<bool(const Assignment&)>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった（探索を打ち切る）
    UNSAT,    // この枝に解は存在しない
    UNKNOWN   // 停止要求により中断
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;      // 整合性チェックを通過した割当の数
    size_t fail_count = 0;      // 候補を使い果たしてバックトラックした回数
    size_t max_depth = 0;
    size_t arc_count = 0;       // AC-3 が処理したアーク数
    size_t revision_count = 0;  // 定義域を狭めた revise の回数
    size_t solution_count = 0;
};

/**
 * @brief クロスワードCSPソルバー
 *
 * 1. ノード整合性（単語長）
 * 2. 全アークで AC-3
 * 3. 割当のコピーを伸ばしていく再帰バックトラック
 *    - 変数選択: MRV、同点は次数
 *    - 値選択: LCV
 *
 * solve 呼び出しごとに定義域ストアを新たに構築するので、
 * 同じ Puzzle を複数のソルバーで同時に解いてもよい。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param puzzle 解くパズル
     * @return 解が見つかればその解、なければstd::nullopt
     */
    std::optional<Assignment> solve(const Puzzle& puzzle);

    /**
     * @brief 全ての解を探索
     * @param puzzle 解くパズル
     * @param callback 解が見つかるたびに呼ばれるコールバック
     * @return 見つかった解の数
     */
    size_t solve_all(const Puzzle& puzzle, AssignmentCallback callback);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 探索中の推論（割当ごとの AC-3）を有効/無効にする
     *
     * 解の集合は変わらず、探索順と探索量だけが変わる。デフォルトは無効。
     */
    void set_inference(bool enabled) { inference_ = enabled; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief presolve（ノード整合性 + 全アークの AC-3）
     * @return 伝播成功ならtrue、定義域が空になったらfalse
     */
    bool presolve(const Puzzle& puzzle, DomainStore& domains);

    /**
     * @brief 再帰バックトラック
     * @param assignment 現在の部分割当（呼び出し側のコピー）
     * @param callback 完全割当ごとに呼ばれる。falseで探索終了
     */
    SearchResult run_search(const Puzzle& puzzle, const DomainStore& domains,
                            const Assignment& assignment, size_t depth,
                            const AssignmentCallback& callback);

    /**
     * @brief slot -> word を確定したときの推論
     * @param domains 呼び出し側のコピー。成功時は絞り込まれた状態になる
     * @return 定義域が空にならなければtrue
     */
    bool infer(const Puzzle& puzzle, DomainStore& domains,
               const Assignment& assignment, size_t slot, const std::string& word);

    void reset_stats();

    std::atomic<bool> stopped_{false};
    bool verbose_ = false;
    bool inference_ = false;

    SolverStats stats_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_SOLVER_HPP
