#ifndef SPLICER_BASE_SPAN_H_
#define SPLICER_BASE_SPAN_H_

#include <cstddef>
#include <type_traits>
#include <utility>

namespace splicer {
namespace base {

// A minimal Span class representing a borrowed, contiguous range of elements.
// The splicer reads its input through Span<const uint8_t>; the span never owns
// or mutates the underlying storage.
template <typename T>
class Span {
 public:
  Span() : ptr_(nullptr), len_(0) {}
  Span(T* ptr, size_t len) : ptr_(ptr), len_(len) {}

  // Views any contiguous container exposing data() and size()
  // (std::vector, std::array, std::string). Spans themselves are copied by
  // the implicit copy constructor.
  template <typename Container,
            typename = std::enable_if_t<
                !std::is_same_v<std::remove_cv_t<Container>, Span> &&
                std::is_convertible_v<decltype(std::declval<Container&>().data()), T*>>,
            typename = decltype(std::declval<Container&>().size())>
  Span(Container& c) : ptr_(c.data()), len_(c.size()) {}

  T* data() const { return ptr_; }
  size_t size() const { return len_; }
  bool empty() const { return len_ == 0; }

  T& operator[](size_t index) const {
    // Note: No bounds checking for performance, assume valid usage.
    return ptr_[index];
  }

  T* begin() const { return ptr_; }
  T* end() const { return ptr_ + len_; }

 private:
  T* ptr_;
  size_t len_;
};

}  // namespace base
}  // namespace splicer

#endif  // SPLICER_BASE_SPAN_H_
