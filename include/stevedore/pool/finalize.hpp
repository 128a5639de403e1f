#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "stevedore/pool/signals.hpp"

namespace stevedore::pool {

enum class FollowupKind {
    Continue,       // enqueue items (possibly none)
    Failed,         // record the reply in Signals::failed, then enqueue items
    Unrecoverable   // wind the whole pool down
};

// What a finalize callback decides to do with one reply.
template<typename Item>
struct Followups {
    std::vector<Item> items;
    FollowupKind kind = FollowupKind::Continue;

    static Followups none() { return {}; }

    static Followups of(std::vector<Item> items) {
        Followups f;
        f.items = std::move(items);
        return f;
    }

    static Followups retry(Item item) {
        Followups f;
        f.items.push_back(std::move(item));
        return f;
    }

    static Followups failed() {
        Followups f;
        f.kind = FollowupKind::Failed;
        return f;
    }

    static Followups unrecoverable() {
        Followups f;
        f.kind = FollowupKind::Unrecoverable;
        return f;
    }

    bool is_failed() const { return kind == FollowupKind::Failed; }
    bool is_unrecoverable() const { return kind == FollowupKind::Unrecoverable; }
};

template<typename Item>
using FinalizeFn = std::function<Followups<Item>(const Item& reply, Signals<Item>& signals)>;

} // namespace stevedore::pool
