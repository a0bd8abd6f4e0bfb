#include <stdexcept>

#include "sdqc/thread_store.hpp"

namespace sdqc {

const Message& ThreadStore::add(Message m)
{
    if (m.id.empty())
        throw std::runtime_error("message without id");
    if (by_id_.count(m.id))
        throw std::runtime_error("duplicate message id " + m.id);

    msgs_.push_back(std::make_unique<Message>(std::move(m)));
    const Message* p = msgs_.back().get();
    by_id_.emplace(p->id, p);
    return *p;
}

const Message* ThreadStore::find(const std::string& id) const
{
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

const Message* ThreadStore::parent(const Message& m) const
{
    if (m.parent_id.empty()) return nullptr;
    const Message* p = find(m.parent_id);
    if (!p && warned_dangling_.insert(m.parent_id).second)
        logW("parent " + m.parent_id + " of " + m.id +
             " not loaded, treating " + m.id + " as root");
    return p;
}

const Message& ThreadStore::root_of(const Message& m) const
{
    const Message* cur = &m;
    /* a finite tree never needs more steps than there are messages */
    for (size_t steps = 0; steps <= msgs_.size(); ++steps) {
        const Message* up = parent(*cur);
        if (!up) return *cur;
        cur = up;
    }
    throw std::runtime_error("parent cycle detected above message " + m.id);
}

size_t ThreadStore::depth_of(const Message& m) const
{
    size_t depth = 0;
    const Message* cur = &m;
    while (const Message* up = parent(*cur)) {
        cur = up;
        if (++depth > msgs_.size())
            throw std::runtime_error("parent cycle detected above message " + m.id);
    }
    return depth;
}

std::vector<const Message*> ThreadStore::messages() const
{
    std::vector<const Message*> out;
    out.reserve(msgs_.size());
    for (const auto& p : msgs_) out.push_back(p.get());
    return out;
}

} // namespace sdqc
