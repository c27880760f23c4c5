/***
 * Name: tether::memory::Stack, StackPage
 * Purpose: Page arena, cursor movement and root enumeration for the shadow stack.
 */
#include "tether/memory/Stack.h"
#include "tether/exceptions/stack_overflow.h"
#include <algorithm>
#include <cstddef>
#include <memory>

namespace tether::memory {

StackPage::StackPage(std::size_t nSlots)
    : size_(nSlots),
      slots_(std::make_unique<void*[]>(nSlots)),
      stamps_(std::make_unique<uint64_t[]>(nSlots)) {}

void StackPage::clear(std::size_t from, std::size_t to) noexcept {
  std::fill(slots_.get() + from, slots_.get() + to, nullptr);
  std::fill(stamps_.get() + from, stamps_.get() + to, uint64_t{0});
}

Stack::Stack(std::size_t pageSlots) : pageSlots_(std::max(pageSlots, StackPage::kMinSlots)) {
  pages_.push_back(std::make_unique<StackPage>(pageSlots_));
}

Stack::~Stack() = default;

namespace {
// Ensure pages[index] exists and holds at least n slots. A page that is too small is kept
// (shifted up by one) rather than freed.
void ensure_page(std::vector<std::unique_ptr<StackPage>>& pages, std::size_t index, std::size_t n,
                 std::size_t pageSlots) {
  if (index < pages.size() && pages[index]->size() >= n) { return; }
  auto page = std::make_unique<StackPage>(std::max(n, pageSlots));
  if (index >= pages.size()) {
    pages.push_back(std::move(page));
  } else {
    pages.insert(pages.begin() + static_cast<std::ptrdiff_t>(index), std::move(page));
  }
}
} // namespace

SlotRef Stack::take(std::size_t n) {
  if (n > kMaxFrameSlots) { throw exceptions::StackOverflow(n, kMaxFrameSlots); }
  if (n == 0) { return SlotRef{}; }
  StackPage* page = pages_[cursor_.page].get();
  if (cursor_.offset + n > page->size()) {
    ensure_page(pages_, cursor_.page + 1, n, pageSlots_);
    cursor_ = Cursor{cursor_.page + 1, 0};
    page = pages_[cursor_.page].get();
  }
  const SlotRef ref{page->slot(cursor_.offset), page->stamp(cursor_.offset)};
  cursor_.offset += n;
  return ref;
}

SlotRef Stack::take_side(std::size_t n) {
  if (n > kMaxFrameSlots) { throw exceptions::StackOverflow(n, kMaxFrameSlots); }
  ensure_page(side_, sideTop_, n, pageSlots_);
  StackPage* buf = side_[sideTop_].get();
  ++sideTop_;
  return SlotRef{buf->slot(0), buf->stamp(0)};
}

uint64_t Stack::write(SlotRef ref, void* obj) noexcept {
  *ref.slot = obj;
  *ref.stamp = ++epoch_;
  return *ref.stamp;
}

void Stack::reserve(std::size_t n) {
  if (n > kMaxFrameSlots) { throw exceptions::StackOverflow(n, kMaxFrameSlots); }
  if (cursor_.offset + n <= pages_[cursor_.page]->size()) { return; }
  ensure_page(pages_, cursor_.page + 1, n, pageSlots_);
}

Stack::Mark Stack::push_frame(Frame* frame) noexcept {
  const Mark mark{cursor_, sideTop_};
  top_ = frame;
  return mark;
}

void Stack::pop_frame(const Mark& mark, Frame* previous) noexcept {
  for (std::size_t p = mark.cursor.page; p <= cursor_.page; ++p) {
    const std::size_t from = p == mark.cursor.page ? mark.cursor.offset : 0;
    const std::size_t to = p == cursor_.page ? cursor_.offset : pages_[p]->size();
    if (from < to) { pages_[p]->clear(from, to); }
  }
  for (std::size_t s = mark.side; s < sideTop_; ++s) { side_[s]->clear(0, side_[s]->size()); }
  cursor_ = mark.cursor;
  sideTop_ = mark.side;
  top_ = previous;
}

void Stack::scan(tether_root_visitor_t visit, void* visitCtx) const {
  for (std::size_t p = 0; p <= cursor_.page; ++p) {
    const StackPage& page = *pages_[p];
    const std::size_t end = p == cursor_.page ? cursor_.offset : page.size();
    for (std::size_t i = 0; i < end; ++i) {
      void* obj = *page.slot(i);
      if (obj != nullptr) { visit(obj, visitCtx); }
    }
  }
  for (std::size_t s = 0; s < sideTop_; ++s) {
    const StackPage& buf = *side_[s];
    for (std::size_t i = 0; i < buf.size(); ++i) {
      void* obj = *buf.slot(i);
      if (obj != nullptr) { visit(obj, visitCtx); }
    }
  }
}

void Stack::scan_roots(void* ctx, tether_root_visitor_t visit, void* visitCtx) {
  static_cast<const Stack*>(ctx)->scan(visit, visitCtx);
}

std::size_t Stack::live_slots() const {
  std::size_t count = 0;
  scan([](void* /*obj*/, void* ctx) { ++*static_cast<std::size_t*>(ctx); }, &count);
  return count;
}

} // namespace tether::memory
