#pragma once

#include "Envelope.hpp"
#include "TrackedPoint.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

namespace Vicinity {

/**
 * @brief Node capacity parameters for RTree
 */
struct RTreeConfig {
    size_t maxEntriesPerNode = 6;
    size_t minEntriesPerNode = 3;
};

/**
 * @brief R-tree over tracked points in 2 or 3 dimensions
 *
 * Features:
 * - Top-down sort-tile bulk loading with uniform leaf depth
 * - Single insertion with least-enlargement descent and quadratic split
 * - Removal by exact value or by predicate, with underfull node condensing
 * - Branch-and-bound nearest neighbour
 * - Lazy best-first nearest neighbour iteration
 * - Radius queries on squared distance
 *
 * The tree does not deduplicate: inserting the same entity twice stores two
 * entries.
 *
 * @tparam Dim Number of coordinate axes (2 or 3)
 */
template<glm::length_t Dim>
class RTree {
public:
    using Point = TrackedPoint<Dim>;
    using Coord = typename Point::Coord;
    using EnvelopeType = Envelope<Dim>;
    using Config = RTreeConfig;

    /**
     * @brief R-tree node. Leaves hold points, internal nodes hold children.
     */
    struct Node {
        EnvelopeType envelope;
        std::vector<std::unique_ptr<Node>> children;
        std::vector<Point> points;
        bool isLeaf = true;

        [[nodiscard]] size_t GetEntryCount() const noexcept {
            return isLeaf ? points.size() : children.size();
        }
    };

    /**
     * @brief Best-first iterator yielding points by non-decreasing distance
     *
     * Invalidated by any mutation of the tree it walks.
     */
    class NearestIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Point;
        using difference_type = std::ptrdiff_t;
        using pointer = const Point*;
        using reference = const Point&;

        NearestIterator() = default;

        NearestIterator(const Node* root, const Coord& query)
            : m_query(query) {
            if (root) {
                m_queue.push(Candidate{root->envelope.DistanceSquared(query), root, nullptr});
            }
            Advance();
        }

        reference operator*() const { return *m_current; }
        pointer operator->() const { return m_current; }

        NearestIterator& operator++() {
            Advance();
            return *this;
        }

        void operator++(int) { Advance(); }

        [[nodiscard]] bool operator==(const NearestIterator& other) const noexcept {
            return m_current == other.m_current;
        }

        /**
         * @brief Squared distance of the current point to the query
         */
        [[nodiscard]] float GetDistanceSquared() const noexcept { return m_currentDistance2; }

    private:
        struct Candidate {
            float distance2 = 0.0f;
            const Node* node = nullptr;
            const Point* point = nullptr;

            bool operator>(const Candidate& other) const noexcept {
                return distance2 > other.distance2;
            }
        };

        void Advance() {
            m_current = nullptr;
            while (!m_queue.empty()) {
                Candidate top = m_queue.top();
                m_queue.pop();

                if (top.point) {
                    m_current = top.point;
                    m_currentDistance2 = top.distance2;
                    return;
                }

                const Node* node = top.node;
                if (node->isLeaf) {
                    for (const auto& point : node->points) {
                        m_queue.push(Candidate{point.DistanceSquared(m_query), nullptr, &point});
                    }
                } else {
                    for (const auto& child : node->children) {
                        m_queue.push(Candidate{child->envelope.DistanceSquared(m_query), child.get(), nullptr});
                    }
                }
            }
        }

        std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> m_queue;
        const Point* m_current = nullptr;
        float m_currentDistance2 = 0.0f;
        Coord m_query{0.0f};
    };

    /**
     * @brief Restartable range over NearestIterator; each begin() starts a new search
     */
    class NearestRange {
    public:
        NearestRange(const Node* root, const Coord& query) : m_root(root), m_query(query) {}

        [[nodiscard]] NearestIterator begin() const { return NearestIterator(m_root, m_query); }
        [[nodiscard]] NearestIterator end() const { return NearestIterator(); }

    private:
        const Node* m_root;
        Coord m_query;
    };

    RTree() : RTree(Config()) {}

    explicit RTree(const Config& config)
        : m_config(SanitizeConfig(config))
        , m_root(std::make_unique<Node>()) {}

    ~RTree() = default;

    // Non-copyable, movable
    RTree(const RTree&) = delete;
    RTree& operator=(const RTree&) = delete;
    RTree(RTree&&) noexcept = default;
    RTree& operator=(RTree&&) noexcept = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /**
     * @brief Build a tree from all points at once
     *
     * Cheaper than repeated Insert() and produces better packed nodes.
     */
    [[nodiscard]] static RTree BulkLoad(std::vector<Point> points, const Config& config = Config()) {
        RTree tree(config);
        if (points.empty()) {
            return tree;
        }

        const size_t maxEntries = tree.m_config.maxEntriesPerNode;
        size_t height = 1;
        size_t capacity = maxEntries;
        while (capacity < points.size()) {
            capacity *= maxEntries;
            ++height;
        }

        tree.m_root = tree.BuildRecursive(points, 0, points.size(), height);
        tree.m_size = points.size();
        return tree;
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    void Insert(const Point& point) {
        InsertPoint(point);
        ++m_size;
    }

    /**
     * @brief Remove one entry equal to point (same position and entity)
     * @return true if an entry was removed
     */
    bool Remove(const Point& point) {
        const Coord& position = point.GetPosition();
        size_t removed = RemoveWhere(
            [&point](const Point& candidate) { return candidate == point; },
            [&position](const EnvelopeType& envelope) { return envelope.Contains(position); },
            false);
        return removed > 0;
    }

    /**
     * @brief Remove every entry matching a predicate, visiting the whole tree
     * @return Number of entries removed
     */
    template<typename Predicate>
    size_t RemoveIf(Predicate&& predicate) {
        return RemoveWhere(
            std::forward<Predicate>(predicate),
            [](const EnvelopeType&) { return true; },
            true);
    }

    void Clear() {
        m_root = std::make_unique<Node>();
        m_size = 0;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::optional<Point> NearestNeighbour(const Coord& query) const {
        if (m_size == 0) {
            return std::nullopt;
        }

        const Point* nearest = nullptr;
        float nearestDist2 = std::numeric_limits<float>::infinity();
        NearestRecursive(*m_root, query, nearest, nearestDist2);

        if (!nearest) {
            return std::nullopt;
        }
        return *nearest;
    }

    [[nodiscard]] NearestRange NearestNeighbours(const Coord& query) const {
        return NearestRange(m_size == 0 ? nullptr : m_root.get(), query);
    }

    /**
     * @brief All points whose squared distance to center is <= distance2
     */
    [[nodiscard]] std::vector<Point> LocateWithinDistance(const Coord& center, float distance2) const {
        std::vector<Point> results;
        if (m_size > 0) {
            WithinDistanceRecursive(*m_root, center, distance2, results);
        }
        return results;
    }

    /**
     * @brief Visit every stored point
     */
    template<typename Visitor>
    void ForEach(Visitor&& visitor) const {
        ForEachRecursive(*m_root, visitor);
    }

    // =========================================================================
    // Information
    // =========================================================================

    [[nodiscard]] size_t Size() const noexcept { return m_size; }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_size == 0; }
    [[nodiscard]] const Config& GetConfig() const noexcept { return m_config; }

    /**
     * @brief Number of levels from root to leaves
     */
    [[nodiscard]] int GetDepth() const noexcept {
        int depth = 1;
        const Node* node = m_root.get();
        while (!node->isLeaf && !node->children.empty()) {
            node = node->children.front().get();
            ++depth;
        }
        return depth;
    }

    /**
     * @brief Check structural invariants
     *
     * Leaves share one depth, every envelope contains its entries, no node
     * exceeds capacity, and the stored point count equals Size().
     */
    [[nodiscard]] bool Validate() const {
        int leafDepth = -1;
        size_t count = 0;
        if (!ValidateRecursive(*m_root, 1, leafDepth, count)) {
            return false;
        }
        return count == m_size;
    }

private:
    [[nodiscard]] static Config SanitizeConfig(Config config) noexcept {
        config.maxEntriesPerNode = std::max<size_t>(config.maxEntriesPerNode, 3);
        config.minEntriesPerNode = std::clamp<size_t>(
            config.minEntriesPerNode, 1, config.maxEntriesPerNode / 2);
        return config;
    }

    static void RecomputeEnvelope(Node& node) noexcept {
        node.envelope = EnvelopeType();
        if (node.isLeaf) {
            for (const auto& point : node.points) {
                node.envelope.Expand(point.GetPosition());
            }
        } else {
            for (const auto& child : node.children) {
                node.envelope.Expand(child->envelope);
            }
        }
    }

    // Bulk loading
    std::unique_ptr<Node> BuildRecursive(std::vector<Point>& points, size_t begin, size_t end,
                                         size_t height) {
        auto node = std::make_unique<Node>();

        if (height <= 1) {
            node->isLeaf = true;
            node->points.assign(points.begin() + begin, points.begin() + end);
            RecomputeEnvelope(*node);
            return node;
        }

        size_t childCapacity = 1;
        for (size_t i = 1; i < height; ++i) {
            childCapacity *= m_config.maxEntriesPerNode;
        }

        node->isLeaf = false;
        PartitionAxis(points, begin, end, 0, childCapacity, height - 1, node->children);
        RecomputeEnvelope(*node);
        return node;
    }

    void PartitionAxis(std::vector<Point>& points, size_t begin, size_t end, glm::length_t axis,
                       size_t childCapacity, size_t childHeight,
                       std::vector<std::unique_ptr<Node>>& out) {
        const size_t count = end - begin;
        const size_t numChildren = (count + childCapacity - 1) / childCapacity;

        std::sort(points.begin() + begin, points.begin() + end,
            [axis](const Point& a, const Point& b) {
                return a.GetPosition()[axis] < b.GetPosition()[axis];
            });

        if (axis == Dim - 1 || numChildren <= 1) {
            for (size_t start = begin; start < end; start += childCapacity) {
                out.push_back(BuildRecursive(points, start, std::min(start + childCapacity, end), childHeight));
            }
            return;
        }

        // Slabs along this axis, each holding a whole number of children
        const auto remainingAxes = static_cast<double>(Dim - axis);
        const auto slabs = static_cast<size_t>(
            std::ceil(std::pow(static_cast<double>(numChildren), 1.0 / remainingAxes)));
        const size_t childrenPerSlab = (numChildren + slabs - 1) / slabs;
        const size_t slabSize = childrenPerSlab * childCapacity;

        for (size_t start = begin; start < end; start += slabSize) {
            PartitionAxis(points, start, std::min(start + slabSize, end), axis + 1,
                          childCapacity, childHeight, out);
        }
    }

    // Insertion
    void InsertPoint(const Point& point) {
        auto sibling = InsertRecursive(*m_root, point);
        if (sibling) {
            auto newRoot = std::make_unique<Node>();
            newRoot->isLeaf = false;
            newRoot->children.push_back(std::move(m_root));
            newRoot->children.push_back(std::move(sibling));
            RecomputeEnvelope(*newRoot);
            m_root = std::move(newRoot);
        }
    }

    std::unique_ptr<Node> InsertRecursive(Node& node, const Point& point) {
        node.envelope.Expand(point.GetPosition());

        if (node.isLeaf) {
            node.points.push_back(point);
            if (node.points.size() > m_config.maxEntriesPerNode) {
                return SplitNode(node);
            }
            return nullptr;
        }

        Node& child = ChooseSubtree(node, point.GetEnvelope());
        auto sibling = InsertRecursive(child, point);
        if (sibling) {
            node.children.push_back(std::move(sibling));
            if (node.children.size() > m_config.maxEntriesPerNode) {
                return SplitNode(node);
            }
        }
        return nullptr;
    }

    // Enlargement cost: content first, margin breaks ties for flat envelopes
    static std::pair<float, float> EnlargementCost(const EnvelopeType& envelope,
                                                   const EnvelopeType& added) noexcept {
        EnvelopeType merged = EnvelopeType::Merge(envelope, added);
        return {merged.GetContent() - envelope.GetContent(),
                merged.GetMargin() - envelope.GetMargin()};
    }

    Node& ChooseSubtree(Node& node, const EnvelopeType& added) {
        Node* best = node.children.front().get();
        auto bestCost = EnlargementCost(best->envelope, added);
        float bestContent = best->envelope.GetContent();

        for (size_t i = 1; i < node.children.size(); ++i) {
            Node* candidate = node.children[i].get();
            auto cost = EnlargementCost(candidate->envelope, added);
            float content = candidate->envelope.GetContent();
            if (cost < bestCost || (cost == bestCost && content < bestContent)) {
                best = candidate;
                bestCost = cost;
                bestContent = content;
            }
        }
        return *best;
    }

    std::unique_ptr<Node> SplitNode(Node& node) {
        auto sibling = std::make_unique<Node>();
        sibling->isLeaf = node.isLeaf;

        if (node.isLeaf) {
            sibling->points = QuadraticSplit(node.points,
                [](const Point& point) { return point.GetEnvelope(); });
        } else {
            sibling->children = QuadraticSplit(node.children,
                [](const std::unique_ptr<Node>& child) { return child->envelope; });
        }

        RecomputeEnvelope(node);
        RecomputeEnvelope(*sibling);
        return sibling;
    }

    /**
     * @brief Guttman's quadratic split
     *
     * Leaves the first group in entries and returns the second.
     */
    template<typename Entry, typename GetEnvelope>
    std::vector<Entry> QuadraticSplit(std::vector<Entry>& entries, GetEnvelope getEnvelope) const {
        const size_t count = entries.size();
        std::vector<EnvelopeType> envelopes;
        envelopes.reserve(count);
        for (const auto& entry : entries) {
            envelopes.push_back(getEnvelope(entry));
        }

        // Pick the two seeds that would waste the most space together
        size_t seedA = 0;
        size_t seedB = 1;
        std::pair<float, float> worstWaste{std::numeric_limits<float>::lowest(),
                                           std::numeric_limits<float>::lowest()};
        for (size_t i = 0; i < count; ++i) {
            for (size_t j = i + 1; j < count; ++j) {
                EnvelopeType merged = EnvelopeType::Merge(envelopes[i], envelopes[j]);
                std::pair<float, float> waste{
                    merged.GetContent() - envelopes[i].GetContent() - envelopes[j].GetContent(),
                    merged.GetMargin()};
                if (waste > worstWaste) {
                    worstWaste = waste;
                    seedA = i;
                    seedB = j;
                }
            }
        }

        std::vector<size_t> groupA{seedA};
        std::vector<size_t> groupB{seedB};
        EnvelopeType envelopeA = envelopes[seedA];
        EnvelopeType envelopeB = envelopes[seedB];

        std::vector<size_t> remaining;
        remaining.reserve(count - 2);
        for (size_t i = 0; i < count; ++i) {
            if (i != seedA && i != seedB) {
                remaining.push_back(i);
            }
        }

        const size_t minEntries = m_config.minEntriesPerNode;
        while (!remaining.empty()) {
            if (groupA.size() + remaining.size() <= minEntries) {
                groupA.insert(groupA.end(), remaining.begin(), remaining.end());
                break;
            }
            if (groupB.size() + remaining.size() <= minEntries) {
                groupB.insert(groupB.end(), remaining.begin(), remaining.end());
                break;
            }

            // Pick the entry with the strongest preference for one group
            size_t pick = 0;
            float strongest = -1.0f;
            std::pair<float, float> pickCostA;
            std::pair<float, float> pickCostB;
            for (size_t r = 0; r < remaining.size(); ++r) {
                auto costA = EnlargementCost(envelopeA, envelopes[remaining[r]]);
                auto costB = EnlargementCost(envelopeB, envelopes[remaining[r]]);
                float preference = std::abs(costA.first - costB.first) +
                                   std::abs(costA.second - costB.second);
                if (preference > strongest) {
                    strongest = preference;
                    pick = r;
                    pickCostA = costA;
                    pickCostB = costB;
                }
            }

            const size_t index = remaining[pick];
            remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(pick));

            bool toA = pickCostA < pickCostB;
            if (pickCostA == pickCostB) {
                float contentA = envelopeA.GetContent();
                float contentB = envelopeB.GetContent();
                toA = contentA < contentB || (contentA == contentB && groupA.size() <= groupB.size());
            }

            if (toA) {
                groupA.push_back(index);
                envelopeA.Expand(envelopes[index]);
            } else {
                groupB.push_back(index);
                envelopeB.Expand(envelopes[index]);
            }
        }

        std::vector<Entry> first;
        std::vector<Entry> second;
        first.reserve(groupA.size());
        second.reserve(groupB.size());
        for (size_t index : groupA) {
            first.push_back(std::move(entries[index]));
        }
        for (size_t index : groupB) {
            second.push_back(std::move(entries[index]));
        }
        entries = std::move(first);
        return second;
    }

    // Removal
    template<typename Predicate, typename MayContain>
    size_t RemoveWhere(Predicate&& predicate, MayContain&& mayContain, bool removeAll) {
        if (m_size == 0) {
            return 0;
        }

        std::vector<Point> orphans;
        size_t removed = RemoveRecursive(*m_root, predicate, mayContain, removeAll, orphans);
        if (removed == 0) {
            return 0;
        }

        m_size -= removed;
        CondenseRoot();

        // Orphans were already counted in m_size
        for (const auto& orphan : orphans) {
            InsertPoint(orphan);
        }
        return removed;
    }

    template<typename Predicate, typename MayContain>
    size_t RemoveRecursive(Node& node, Predicate& predicate, MayContain& mayContain,
                           bool removeAll, std::vector<Point>& orphans) {
        size_t removed = 0;

        if (node.isLeaf) {
            if (removeAll) {
                auto it = std::remove_if(node.points.begin(), node.points.end(), predicate);
                removed = static_cast<size_t>(std::distance(it, node.points.end()));
                node.points.erase(it, node.points.end());
            } else {
                auto it = std::find_if(node.points.begin(), node.points.end(), predicate);
                if (it != node.points.end()) {
                    node.points.erase(it);
                    removed = 1;
                }
            }
        } else {
            for (size_t i = 0; i < node.children.size();) {
                Node& child = *node.children[i];
                if (!mayContain(child.envelope)) {
                    ++i;
                    continue;
                }

                size_t childRemoved = RemoveRecursive(child, predicate, mayContain, removeAll, orphans);
                if (childRemoved == 0) {
                    ++i;
                    continue;
                }

                removed += childRemoved;
                if (child.GetEntryCount() < m_config.minEntriesPerNode) {
                    CollectPoints(child, orphans);
                    node.children.erase(node.children.begin() + static_cast<std::ptrdiff_t>(i));
                } else {
                    ++i;
                }

                if (!removeAll) {
                    break;
                }
            }
        }

        if (removed > 0) {
            RecomputeEnvelope(node);
        }
        return removed;
    }

    void CondenseRoot() {
        while (!m_root->isLeaf && m_root->children.size() == 1) {
            std::unique_ptr<Node> child = std::move(m_root->children.front());
            m_root = std::move(child);
        }
        if (!m_root->isLeaf && m_root->children.empty()) {
            m_root = std::make_unique<Node>();
        }
    }

    static void CollectPoints(const Node& node, std::vector<Point>& out) {
        if (node.isLeaf) {
            out.insert(out.end(), node.points.begin(), node.points.end());
            return;
        }
        for (const auto& child : node.children) {
            CollectPoints(*child, out);
        }
    }

    // Queries
    static void NearestRecursive(const Node& node, const Coord& query,
                                 const Point*& nearest, float& nearestDist2) {
        if (node.envelope.DistanceSquared(query) > nearestDist2) {
            return;
        }

        if (node.isLeaf) {
            for (const auto& point : node.points) {
                float dist2 = point.DistanceSquared(query);
                if (dist2 < nearestDist2) {
                    nearestDist2 = dist2;
                    nearest = &point;
                }
            }
            return;
        }

        // Visit closer children first
        std::vector<std::pair<float, const Node*>> order;
        order.reserve(node.children.size());
        for (const auto& child : node.children) {
            order.emplace_back(child->envelope.DistanceSquared(query), child.get());
        }
        std::sort(order.begin(), order.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        for (const auto& [dist2, child] : order) {
            if (dist2 > nearestDist2) {
                break;
            }
            NearestRecursive(*child, query, nearest, nearestDist2);
        }
    }

    static void WithinDistanceRecursive(const Node& node, const Coord& center, float distance2,
                                        std::vector<Point>& results) {
        if (node.envelope.DistanceSquared(center) > distance2) {
            return;
        }

        if (node.isLeaf) {
            for (const auto& point : node.points) {
                if (point.DistanceSquared(center) <= distance2) {
                    results.push_back(point);
                }
            }
            return;
        }

        for (const auto& child : node.children) {
            WithinDistanceRecursive(*child, center, distance2, results);
        }
    }

    template<typename Visitor>
    static void ForEachRecursive(const Node& node, Visitor& visitor) {
        if (node.isLeaf) {
            for (const auto& point : node.points) {
                visitor(point);
            }
            return;
        }
        for (const auto& child : node.children) {
            ForEachRecursive(*child, visitor);
        }
    }

    bool ValidateRecursive(const Node& node, int depth, int& leafDepth, size_t& count) const {
        if (node.GetEntryCount() > m_config.maxEntriesPerNode) {
            return false;
        }

        if (node.isLeaf) {
            if (leafDepth < 0) {
                leafDepth = depth;
            } else if (leafDepth != depth) {
                return false;
            }
            for (const auto& point : node.points) {
                if (!node.envelope.Contains(point.GetPosition())) {
                    return false;
                }
            }
            count += node.points.size();
            return true;
        }

        if (node.children.empty()) {
            return false;
        }
        for (const auto& child : node.children) {
            if (!node.envelope.Contains(child->envelope)) {
                return false;
            }
            if (!ValidateRecursive(*child, depth + 1, leafDepth, count)) {
                return false;
            }
        }
        return true;
    }

    Config m_config;
    std::unique_ptr<Node> m_root;
    size_t m_size = 0;
};

using RTree2D = RTree<2>;
using RTree3D = RTree<3>;

} // namespace Vicinity
