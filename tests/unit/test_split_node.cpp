#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <vector>

#include "fake_session.hpp"
#include "ui/split_node.hpp"

using namespace termpane;
using termpane::test::FakeSession;

namespace
{

// Owns the sessions a tree refers to and labels them a, b, c... for describe().
class SessionPool
{
   public:
    FakeSession& make()
    {
        sessions_.push_back(std::make_unique<FakeSession>());
        return *sessions_.back();
    }

    FakeSession& operator[](size_t i) { return *sessions_[i]; }

    SplitNode::Labeler labeler() const
    {
        return [this](const TerminalSession& s)
        {
            for (size_t i = 0; i < sessions_.size(); ++i)
            {
                if (sessions_[i].get() == &s)
                    return std::string(1, static_cast<char>('a' + i));
            }
            return std::string("?");
        };
    }

   private:
    std::vector<std::unique_ptr<FakeSession>> sessions_;
};

std::vector<SessionId> ids_of(const std::vector<TerminalSession*>& sessions)
{
    std::vector<SessionId> out;
    for (auto* s : sessions)
        out.push_back(s->id());
    return out;
}

}   // anonymous namespace

// ─── Construction ────────────────────────────────────────────────────────────

TEST(SplitNodeConstruction, LeafAttachesSurface)
{
    FakeSession s;
    SplitNode   node(s, Rect{0, 0, 100, 50});

    EXPECT_TRUE(node.is_leaf());
    EXPECT_FALSE(node.is_split());
    EXPECT_EQ(node.session(), &s);
    EXPECT_EQ(node.parent(), nullptr);
    EXPECT_EQ(node.count_nodes(), 1u);
    EXPECT_EQ(node.count_leaves(), 1u);
    EXPECT_EQ(node.count_splits(), 0u);

    EXPECT_TRUE(s.surface().is_attached());
    EXPECT_EQ(s.surface().host_id(), node.id());
    EXPECT_EQ(s.surface().frame(), (Rect{0, 0, 100, 50}));
}

TEST(SplitNodeConstruction, UniqueIds)
{
    FakeSession a, b;
    SplitNode   na(a);
    SplitNode   nb(b);
    EXPECT_NE(na.id(), nb.id());
}

TEST(SplitNodeConstruction, LeafAccessorsOnSplitOnlyFields)
{
    FakeSession s;
    SplitNode   node(s);
    EXPECT_EQ(node.first(), nullptr);
    EXPECT_EQ(node.second(), nullptr);
    EXPECT_FLOAT_EQ(node.ratio(), SplitNode::DEFAULT_RATIO);
    EXPECT_EQ(node.divider_rect(), Rect{});
}

// ─── Split ───────────────────────────────────────────────────────────────────

TEST(SplitNodeSplit, NewSecondKeepsOldContentFirst)
{
    SessionPool pool;
    SplitNode   root(pool.make(), Rect{0, 0, 200, 100});
    SplitNode*  created = root.split(pool.make(), SplitAxis::Horizontal, false);

    ASSERT_NE(created, nullptr);
    EXPECT_TRUE(root.is_split());
    EXPECT_EQ(root.axis(), SplitAxis::Horizontal);
    EXPECT_FLOAT_EQ(root.ratio(), 0.5f);
    EXPECT_EQ(root.second(), created);
    EXPECT_EQ(root.first()->session(), &pool[0]);
    EXPECT_EQ(created->session(), &pool[1]);
    EXPECT_EQ(created->parent(), &root);
    EXPECT_EQ(root.first()->parent(), &root);
    EXPECT_EQ(root.describe(pool.labeler()), "H(a,b)");
    EXPECT_TRUE(root.check_invariants());
}

TEST(SplitNodeSplit, NewFirstPutsNewLeafFirst)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  created = root.split(pool.make(), SplitAxis::Vertical, true);

    EXPECT_EQ(root.first(), created);
    EXPECT_EQ(root.describe(pool.labeler()), "V(b,a)");
}

TEST(SplitNodeSplit, OldSurfaceRehomedNotLost)
{
    SessionPool pool;
    SplitNode   root(pool.make(), Rect{0, 0, 200, 100});
    FakeSession& old = pool[0];
    const auto  attaches_before = old.surface().attach_count();

    root.split(pool.make(), SplitAxis::Horizontal, false);

    // The session object is the same; only its surface moved hosts.
    EXPECT_EQ(root.first()->session(), &old);
    EXPECT_TRUE(old.surface().is_attached());
    EXPECT_EQ(old.surface().host_id(), root.first()->id());
    EXPECT_EQ(old.surface().attach_count(), attaches_before + 1);
    EXPECT_EQ(old.start_calls, 0);
    EXPECT_EQ(old.terminate_calls, 0);
}

TEST(SplitNodeSplit, OldChildKeepsFrameNewLeafAnchoredAtEdge)
{
    SessionPool pool;
    const Rect  frame{10, 20, 200, 100};
    SplitNode   root(pool.make(), frame);

    SplitNode* right = root.split(pool.make(), SplitAxis::Horizontal, false);
    EXPECT_EQ(root.first()->frame(), frame);
    EXPECT_EQ(right->frame(), (Rect{210, 20, 0, 100}));

    SplitNode  other(pool.make(), frame);
    SplitNode* top = other.split(pool.make(), SplitAxis::Vertical, true);
    EXPECT_EQ(other.second()->frame(), frame);
    EXPECT_EQ(top->frame(), (Rect{10, 120, 200, 0}));
}

TEST(SplitNodeSplit, NestedSplitAtAnyDepth)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  b = root.split(pool.make(), SplitAxis::Horizontal, false);
    SplitNode*  c = b->split(pool.make(), SplitAxis::Vertical, false);
    c->split(pool.make(), SplitAxis::Horizontal, true);

    EXPECT_EQ(root.describe(pool.labeler()), "H(a,V(b,H(d,c)))");
    EXPECT_EQ(root.count_leaves(), 4u);
    EXPECT_EQ(root.count_splits(), 3u);
    EXPECT_EQ(root.count_nodes(), 7u);
    EXPECT_TRUE(root.check_invariants());
}

TEST(SplitNodeSplit, AnySplitSequenceKeepsEverySessionOnce)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    std::vector<SessionId> added{pool[0].id()};

    // Deterministic but irregular target/axis/order choices.
    for (int i = 1; i < 24; ++i)
    {
        auto       leaves = root.all_sessions();
        SplitNode* target = root.find_node(leaves[(i * 7) % leaves.size()]->id());
        ASSERT_NE(target, nullptr);
        FakeSession& s = pool.make();
        target->split(s, i % 3 == 0 ? SplitAxis::Vertical : SplitAxis::Horizontal, i % 2 == 0);
        added.push_back(s.id());
        ASSERT_TRUE(root.check_invariants());
    }

    auto got = ids_of(root.all_sessions());
    EXPECT_EQ(got.size(), added.size());
    EXPECT_EQ(std::multiset<SessionId>(got.begin(), got.end()),
              std::multiset<SessionId>(added.begin(), added.end()));
}

// ─── Remove ──────────────────────────────────────────────────────────────────

TEST(SplitNodeRemove, DirectChildPromotesSibling)
{
    SessionPool pool;
    SplitNode   root(pool.make(), Rect{0, 0, 200, 100});
    root.split(pool.make(), SplitAxis::Horizontal, false);
    const auto root_id = root.id();

    EXPECT_TRUE(root.remove(pool[1].id()));
    EXPECT_TRUE(root.is_leaf());
    EXPECT_EQ(root.id(), root_id);
    EXPECT_EQ(root.session(), &pool[0]);
    EXPECT_EQ(root.find_node(pool[1].id()), nullptr);
    EXPECT_FALSE(pool[1].surface().is_attached());
    EXPECT_EQ(pool[0].surface().host_id(), root.id());
}

TEST(SplitNodeRemove, PromotedSplitReparentsGrandchildren)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  b = root.split(pool.make(), SplitAxis::Horizontal, false);
    b->split(pool.make(), SplitAxis::Vertical, false);
    ASSERT_EQ(root.describe(pool.labeler()), "H(a,V(b,c))");

    EXPECT_TRUE(root.remove(pool[0].id()));
    EXPECT_EQ(root.describe(pool.labeler()), "V(b,c)");
    EXPECT_EQ(root.first()->parent(), &root);
    EXPECT_EQ(root.second()->parent(), &root);
    EXPECT_EQ(root.parent(), nullptr);
    EXPECT_TRUE(root.check_invariants());
}

TEST(SplitNodeRemove, NestedRemovalCollapsesOneLevel)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  b = root.split(pool.make(), SplitAxis::Horizontal, false);
    b->split(pool.make(), SplitAxis::Vertical, false);

    const size_t nodes_before  = root.count_nodes();
    const size_t splits_before = root.count_splits();

    EXPECT_TRUE(root.remove(pool[2].id()));
    EXPECT_EQ(root.describe(pool.labeler()), "H(a,b)");
    EXPECT_EQ(root.count_splits(), splits_before - 1);
    EXPECT_EQ(root.count_nodes(), nodes_before - 2);
    EXPECT_TRUE(root.check_invariants());
}

TEST(SplitNodeRemove, RemainingSessionsAreSetMinusRemoved)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    for (int i = 1; i < 8; ++i)
    {
        auto leaves = root.all_sessions();
        root.find_node(leaves.back()->id())
            ->split(pool.make(), i % 2 ? SplitAxis::Horizontal : SplitAxis::Vertical, i % 3 == 0);
    }

    for (size_t victim : {3u, 0u, 6u, 1u})
    {
        auto before = ids_of(root.all_sessions());
        const SessionId id = pool[victim].id();

        ASSERT_TRUE(root.remove(id));
        EXPECT_EQ(root.find_node(id), nullptr);

        auto after = ids_of(root.all_sessions());
        before.erase(std::find(before.begin(), before.end(), id));
        EXPECT_EQ(after, before);
        EXPECT_TRUE(root.check_invariants());
    }
}

TEST(SplitNodeRemove, UnknownIdIsNoOp)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    root.split(pool.make(), SplitAxis::Horizontal, false);

    EXPECT_FALSE(root.remove(generate_session_id()));
    EXPECT_EQ(root.count_leaves(), 2u);
}

TEST(SplitNodeRemove, LeafNeverRemovesItself)
{
    FakeSession s;
    SplitNode   root(s);
    EXPECT_FALSE(root.remove(s.id()));
    EXPECT_TRUE(root.is_leaf());
    EXPECT_EQ(root.session(), &s);
}

// ─── Queries ─────────────────────────────────────────────────────────────────

TEST(SplitNodeQuery, AllSessionsDepthFirstFirstChildFirst)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  b = root.split(pool.make(), SplitAxis::Horizontal, true);
    b->split(pool.make(), SplitAxis::Vertical, false);

    // H(V(b,c),a)
    auto got = root.all_sessions();
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0], &pool[1]);
    EXPECT_EQ(got[1], &pool[2]);
    EXPECT_EQ(got[2], &pool[0]);
}

TEST(SplitNodeQuery, FindNodeReturnsLeaf)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  b = root.split(pool.make(), SplitAxis::Horizontal, false);

    EXPECT_EQ(root.find_node(pool[1].id()), b);
    EXPECT_EQ(root.find_node(pool[0].id()), root.first());
    EXPECT_EQ(root.find_node(generate_session_id()), nullptr);

    const SplitNode& croot = root;
    EXPECT_EQ(croot.find_node(pool[1].id()), b);
}

TEST(SplitNodeQuery, RatioClamped)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    root.split(pool.make(), SplitAxis::Horizontal, false);

    root.set_ratio(0.01f);
    EXPECT_FLOAT_EQ(root.ratio(), SplitNode::MIN_RATIO);
    root.set_ratio(0.99f);
    EXPECT_FLOAT_EQ(root.ratio(), SplitNode::MAX_RATIO);
    root.set_ratio(0.3f);
    EXPECT_FLOAT_EQ(root.ratio(), 0.3f);
}

TEST(SplitNodeQuery, DescribeDefaultsToShortIds)
{
    FakeSession s;
    SplitNode   root(s);
    EXPECT_EQ(root.describe(), s.id().substr(0, 8));
}

// ─── Layout ──────────────────────────────────────────────────────────────────

TEST(SplitNodeLayout, HorizontalSplitLeavesDividerGap)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    root.split(pool.make(), SplitAxis::Horizontal, false);
    root.compute_layout(Rect{0, 0, 200, 100}, 2.0f);

    EXPECT_EQ(root.first()->frame(), (Rect{0, 0, 99, 100}));
    EXPECT_EQ(root.second()->frame(), (Rect{101, 0, 99, 100}));
    EXPECT_EQ(root.divider_rect(), (Rect{99, 0, 2, 100}));
    EXPECT_EQ(pool[0].surface().frame(), root.first()->frame());
    EXPECT_EQ(pool[1].surface().frame(), root.second()->frame());
}

TEST(SplitNodeLayout, VerticalFirstChildIsOnTop)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    SplitNode*  top = root.split(pool.make(), SplitAxis::Vertical, true);
    root.compute_layout(Rect{0, 0, 100, 200}, 0.0f);

    EXPECT_EQ(top->frame(), (Rect{0, 100, 100, 100}));
    EXPECT_EQ(root.second()->frame(), (Rect{0, 0, 100, 100}));
}

TEST(SplitNodeLayout, RatioMovesDivider)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    root.split(pool.make(), SplitAxis::Horizontal, false);
    root.set_ratio(0.25f);
    root.compute_layout(Rect{0, 0, 400, 100}, 0.0f);

    EXPECT_FLOAT_EQ(root.first()->frame().w, 100.0f);
    EXPECT_FLOAT_EQ(root.second()->frame().x, 100.0f);
    EXPECT_FLOAT_EQ(root.second()->frame().w, 300.0f);
}

TEST(SplitNodeLayout, SetVisibleReachesEveryLeaf)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    root.split(pool.make(), SplitAxis::Horizontal, false)
        ->split(pool.make(), SplitAxis::Vertical, false);

    root.set_visible(false);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_FALSE(pool[i].surface().is_visible());
    root.set_visible(true);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_TRUE(pool[i].surface().is_visible());
}

TEST(SplitNodeLayout, DetachSurfacesReleasesAll)
{
    SessionPool pool;
    SplitNode   root(pool.make());
    root.split(pool.make(), SplitAxis::Horizontal, false);

    root.detach_surfaces();
    EXPECT_FALSE(pool[0].surface().is_attached());
    EXPECT_FALSE(pool[1].surface().is_attached());
}
