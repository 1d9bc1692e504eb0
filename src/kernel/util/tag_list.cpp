#include "kernel/util/tag_list.h"
#include "kernel/debug/assert.h"
#include "kernel/interrupt/intr.h"

TagList::TagList() noexcept {
    head_.next = &tail_;
    tail_.prev = &head_;
}

void TagList::InsertBefore(Tag& before, Tag& tag) noexcept {
    dbg::Assert(!tag.IsAttached(), "The tag is already in a list");
    const intr::IntrGuard guard;
    before.prev->next = &tag;
    tag.prev = before.prev;
    tag.next = &before;
    before.prev = &tag;
}

TagList& TagList::PushBack(Tag& tag) noexcept {
    InsertBefore(tail_, tag);
    return *this;
}

void TagList::Tag::Detach() noexcept {
    dbg::Assert(IsAttached());
    const intr::IntrGuard guard;
    prev->next = next;
    next->prev = prev;
    prev = nullptr;
    next = nullptr;
}

TagList::Tag* TagList::GetFront() const noexcept {
    return IsEmpty() ? nullptr : head_.next;
}

TagList::Tag* TagList::Find(const Visitor visitor, void* const arg) const noexcept {
    dbg::Assert(visitor);
    auto curr {head_.next};
    while (curr != &tail_) {
        if (visitor(*curr, arg)) {
            return curr;
        } else {
            curr = curr->next;
        }
    }

    return nullptr;
}

stl::size_t TagList::GetSize() const noexcept {
    stl::size_t len {0};
    auto curr {head_.next};
    while (curr != &tail_) {
        curr = curr->next;
        ++len;
    }

    return len;
}

bool TagList::IsEmpty() const noexcept {
    return head_.next == &tail_;
}
