#pragma once
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace memocache {

// Binary search tree used as a memoization cache. Every Search() and Insert()
// splays the accessed key, or the last node on its search path, to the root.
// Each node owns its children; there are no parent links.
template <class Key, class T, class Compare = std::less<Key>>
class SplayCache {
   public:
    SplayCache() {}
    SplayCache(const SplayCache&) = delete;
    SplayCache& operator=(const SplayCache&) = delete;

    SplayCache(SplayCache&& other) noexcept
        : root_{std::move(other.root_)}, size_{other.size_}, comp_{std::move(other.comp_)} {
        other.size_ = 0;
    }

    SplayCache& operator=(SplayCache&& other) noexcept {
        if (this != &other) {
            Clear();
            root_ = std::move(other.root_);
            size_ = other.size_;
            comp_ = std::move(other.comp_);
            other.size_ = 0;
        }
        return *this;
    }

    ~SplayCache() { Clear(); }

    // The root is replaced by the splay result even when k is absent.
    std::optional<T> Search(const Key& k) {
        Splay(k);
        if (root_ && Equivalent(root_->key, k)) {
            return root_->value;
        }
        return std::nullopt;
    }

    void Insert(const Key& k, const T& v) {
        if (!root_) {
            root_ = std::make_unique<Node>(k, v);
            ++size_;
            return;
        }

        Splay(k);
        if (Equivalent(root_->key, k)) {
            root_->value = v;
            return;
        }

        auto node = std::make_unique<Node>(k, v);
        if (comp_(k, root_->key)) {
            node->left = std::move(root_->left);
            node->right = std::move(root_);
        } else {
            node->right = std::move(root_->right);
            node->left = std::move(root_);
        }
        root_ = std::move(node);
        ++size_;

        assert(!root_->left || comp_(root_->left->key, root_->key));
        assert(!root_->right || comp_(root_->key, root_->right->key));
    }

    std::optional<Key> RootKey() const {
        if (!root_) return std::nullopt;
        return root_->key;
    }

    // Visits (key, value) pairs in ascending key order. Does not splay.
    template <class F>
    void InOrder(F f) const {
        std::vector<const Node*> stack;
        const Node* node = root_.get();
        while (node || !stack.empty()) {
            while (node) {
                stack.push_back(node);
                node = node->left.get();
            }
            node = stack.back();
            stack.pop_back();
            f(static_cast<const Key&>(node->key), static_cast<const T&>(node->value));
            node = node->right.get();
        }
    }

    size_t Height() const {
        size_t height = 0;
        std::vector<std::pair<const Node*, size_t>> stack;
        if (root_) stack.emplace_back(root_.get(), 1);
        while (!stack.empty()) {
            auto [node, depth] = stack.back();
            stack.pop_back();
            height = std::max(height, depth);
            if (node->left) stack.emplace_back(node->left.get(), depth + 1);
            if (node->right) stack.emplace_back(node->right.get(), depth + 1);
        }
        return height;
    }

    size_t Size() const { return size_; }

    bool Empty() const { return !root_; }

    // Rotates the tree into a right spine while releasing it, so a deep tree
    // is freed without recursion.
    void Clear() noexcept {
        while (root_) {
            if (root_->left) {
                RotateRight(root_);
            } else {
                root_ = std::move(root_->right);
            }
        }
        size_ = 0;
    }

   private:
    struct Node;
    using NodePtr = std::unique_ptr<Node>;

    struct Node {
        Node(const Key& k, const T& v) : key{k}, value{v} {}

        Key key;
        T value;
        NodePtr left;
        NodePtr right;
    };

    enum class Step { kZig, kZigZig, kZigZag };

    struct Frame {
        NodePtr* slot;
        bool left;
        Step step;
    };

    NodePtr root_;
    size_t size_{0};
    Compare comp_;

    bool Equivalent(const Key& a, const Key& b) const { return !comp_(a, b) && !comp_(b, a); }

    // x's left child takes x's place, x becomes its right child.
    static void RotateRight(NodePtr& x) noexcept {
        NodePtr y = std::move(x->left);
        x->left = std::move(y->right);
        y->right = std::move(x);
        x = std::move(y);
    }

    static void RotateLeft(NodePtr& x) noexcept {
        NodePtr y = std::move(x->right);
        x->right = std::move(y->left);
        y->left = std::move(x);
        x = std::move(y);
    }

    // Bottom-up splay. The descent records one frame per two levels, the
    // unwind applies the zig-zig / zig-zag rotations deepest frame first.
    // Slots are members of nodes that stay in place, so they remain valid
    // while deeper subtrees are rotated. Nothing is modified before the frame
    // stack is built.
    void Splay(const Key& k) {
        std::vector<Frame> path;
        NodePtr* slot = &root_;
        while (*slot) {
            Node* node = slot->get();
            if (comp_(k, node->key)) {
                Node* child = node->left.get();
                if (!child) break;
                if (comp_(k, child->key)) {
                    path.push_back({slot, true, Step::kZigZig});
                    slot = &child->left;
                } else if (comp_(child->key, k)) {
                    path.push_back({slot, true, Step::kZigZag});
                    slot = &child->right;
                } else {
                    path.push_back({slot, true, Step::kZig});
                    break;
                }
            } else if (comp_(node->key, k)) {
                Node* child = node->right.get();
                if (!child) break;
                if (comp_(child->key, k)) {
                    path.push_back({slot, false, Step::kZigZig});
                    slot = &child->right;
                } else if (comp_(k, child->key)) {
                    path.push_back({slot, false, Step::kZigZag});
                    slot = &child->left;
                } else {
                    path.push_back({slot, false, Step::kZig});
                    break;
                }
            } else {
                break;
            }
        }

        for (auto it = path.rbegin(); it != path.rend(); ++it) {
            NodePtr& root = *it->slot;
            if (it->left) {
                if (it->step == Step::kZigZig) {
                    RotateRight(root);
                } else if (it->step == Step::kZigZag && root->left->right) {
                    RotateLeft(root->left);
                }
                if (root->left) RotateRight(root);
            } else {
                if (it->step == Step::kZigZig) {
                    RotateLeft(root);
                } else if (it->step == Step::kZigZag && root->right->left) {
                    RotateRight(root->right);
                }
                if (root->right) RotateLeft(root);
            }
        }
    }
};

}  // namespace memocache
