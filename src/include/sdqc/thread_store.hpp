/* ──────────────────────────────────────────────────────────────
   thread_store.hpp  –  messages, parent links, root resolution
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "sdqc/common.hpp"

namespace sdqc {

struct Message {
    std::string id;
    std::string text;
    std::string parent_id;      // empty ⇒ root
    json        fields = json::object();   // raw metadata (verified, features, …)
};

/*  Owns every message of every loaded thread.  The parent relation is a
 *  lookup by id; a Message never owns (or points to) its parent.        */
class ThreadStore {
public:
    /* throws on duplicate id */
    const Message& add(Message m);

    const Message* find(const std::string& id) const;

    /* nullptr for a root, or when the parent id is not loaded */
    const Message* parent(const Message& m) const;

    /* iterative walk up to the ancestor without parent;
       throws std::runtime_error on a parent cycle            */
    const Message& root_of(const Message& m) const;

    /* number of edges between m and its root */
    size_t depth_of(const Message& m) const;

    bool is_root(const Message& m) const { return parent(m) == nullptr; }

    /* insertion order */
    std::vector<const Message*> messages() const;

    size_t size() const { return msgs_.size(); }

private:
    std::vector<std::unique_ptr<Message>>            msgs_;
    std::unordered_map<std::string, const Message*>  by_id_;
    mutable std::unordered_set<std::string>          warned_dangling_;
};

} // namespace sdqc
