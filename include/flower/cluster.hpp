// === Clusters ================================================================
//
// Tours ("clusters") group the cover cells one relay agent visits. The hub is
// the distinguished central tour: it starts on a placeholder cell at the
// damaged-area centre and is relocated onto a real cell the first time it
// grows. The placeholder is dropped exactly once; a relocated hub that loses
// all its cells stays an empty real tour. Virtual clusters are the provisional, pre-growth groupings.
//
// `recent` and `anchor` are plain cell-id lookups, never ownership edges.

#pragma once

#include <optional>
#include <vector>

#include "flower/grid.hpp"
#include "flower/types.hpp"

namespace flower {

/**
 * @brief Verbatim copy of a cluster's mutable state, used to roll back moves.
 */
struct ClusterState final {
    std::vector<CellId> cells{};        /**< Member cells in insertion order. */
    std::optional<CellId> recent{};     /**< Most recently added cell. */
    std::optional<CellId> anchor{};     /**< Hub cell nearest the cluster. */
    bool completed{};                   /**< Growth finished for this cluster. */
    bool at_placeholder{};              /**< Hub only: still parked on the placeholder. */
    int relocation_count{};             /**< Hub only: placeholder replacements so far. */
};

/** @brief One agent's collection tour: a mutable set of grid cells. */
class Cluster {
  public:
    explicit Cluster(int id);
    virtual ~Cluster() = default;

    Cluster(const Cluster&) = default;
    Cluster& operator=(const Cluster&) = default;
    Cluster(Cluster&&) noexcept = default;
    Cluster& operator=(Cluster&&) noexcept = default;

    [[nodiscard]] int id() const noexcept;
    /** @brief Member cells in insertion order. */
    [[nodiscard]] const std::vector<CellId>& cells() const noexcept;
    [[nodiscard]] bool contains(CellId cell) const;
    /** @brief Cells that may be handed to another cluster. */
    [[nodiscard]] virtual std::vector<CellId> movable_cells() const;
    [[nodiscard]] virtual bool is_hub() const noexcept;

    [[nodiscard]] std::optional<CellId> recent() const noexcept;
    void set_recent(std::optional<CellId> cell) noexcept;
    [[nodiscard]] std::optional<CellId> anchor() const noexcept;
    void set_anchor(std::optional<CellId> cell) noexcept;

    [[nodiscard]] bool completed() const noexcept;
    void mark_completed() noexcept;

    /**
     * @brief Append @p cell, stamp its tour id and make it the recent cell.
     *
     * @throws std::logic_error if the cell already belongs to a cluster.
     */
    virtual void add(Grid& grid, CellId cell);
    /**
     * @brief Remove @p cell and clear its tour id.
     *
     * @throws std::logic_error if the cell is not a member.
     */
    virtual void remove(Grid& grid, CellId cell);

    [[nodiscard]] virtual ClusterState snapshot() const;
    /** @brief Restore membership and bookkeeping; cell stamps are left to the caller. */
    virtual void restore(const ClusterState& state);

  protected:
    int id_;
    std::vector<CellId> list_cells_;
    std::optional<CellId> recent_;
    std::optional<CellId> anchor_;
    bool flag_completed_{false};
};

/** @brief Central collection tour, parked on the damaged-area placeholder until it grows. */
class Hub final : public Cluster {
  public:
    Hub(int id, CellId placeholder);

    [[nodiscard]] CellId placeholder() const noexcept;
    /** @brief True until the first real cell replaces the placeholder. */
    [[nodiscard]] bool at_placeholder() const noexcept;
    /** @brief Number of times the placeholder was replaced by a real cell (0 or 1). */
    [[nodiscard]] int relocation_count() const noexcept;

    [[nodiscard]] std::vector<CellId> movable_cells() const override;
    [[nodiscard]] bool is_hub() const noexcept override;

    /** @brief Replace the placeholder on first use, append afterwards. */
    void add(Grid& grid, CellId cell) override;
    /**
     * @brief Remove a real cell; the hub may become empty.
     *
     * @throws std::logic_error while the hub is still at its placeholder.
     */
    void remove(Grid& grid, CellId cell) override;

    [[nodiscard]] ClusterState snapshot() const override;
    void restore(const ClusterState& state) override;

  private:
    CellId placeholder_;
    bool flag_at_placeholder_{true};
    int relocation_count_{0};
};

/**
 * @brief Provisional grouping of cover cells built before growth.
 */
struct VirtualCluster final {
    int id{};                     /**< Angular-order label, 0..k-1 after relabelling. */
    std::vector<CellId> cells{};  /**< Cover cells grouped into this cluster. */
    Point2 location{};            /**< Centroid of the member cells. */
};

/**
 * @brief The virtual counterpart of the hub: the damaged-area centre.
 */
struct VirtualHub final {
    CellId placeholder{};  /**< Centre cell of the damaged area. */
    Point2 location{};     /**< Centre of that cell. */
};

}  // namespace flower
