#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Backtracking parser combinators over a sequence of input symbols.
//
// A parser maps an input position to a reply: either a value plus the
// remaining input, or a failure. Failures are plain values. A failure is
// "committed" when the parser consumed input before failing; alternation
// only tries its next branch after an uncommitted failure, and attempt()
// turns a committed failure back into an uncommitted one.
//
// A success may carry a hint: the uncommitted failure that stopped it at
// the position where it ended, as when many() runs out of matches. When
// the next parser fails there too, both expectations are reported.

namespace yeb::pc {

  template <typename Sym>
  class input {
  public:
    input() = default;

    explicit input(std::span<const Sym> symbols, std::size_t pos = 0)
        : symbols_(symbols), pos_(pos) {}

    bool
    at_end() const {
      return pos_ >= symbols_.size();
    }

    const Sym&
    peek() const {
      return symbols_[pos_];
    }

    input
    advance(std::size_t n = 1) const {
      return input(symbols_, pos_ + n);
    }

    std::size_t
    position() const {
      return pos_;
    }

  private:
    std::span<const Sym> symbols_;
    std::size_t pos_ = 0;
  };

  struct failure {
    std::string expected;
    std::size_t position = 0;
    bool committed = false;
  };

  template <typename Sym, typename T>
  struct success {
    T value;
    input<Sym> rest;
    std::optional<failure> hint = std::nullopt;
  };

  template <typename Sym, typename T>
  class reply {
  public:
    reply(success<Sym, T> s) : data_(std::move(s)) {}

    reply(failure f) : data_(std::move(f)) {}

    bool
    ok() const {
      return std::holds_alternative<success<Sym, T>>(data_);
    }

    const T&
    value() const {
      return std::get<success<Sym, T>>(data_).value;
    }

    T
    take() {
      return std::move(std::get<success<Sym, T>>(data_).value);
    }

    const input<Sym>&
    rest() const {
      return std::get<success<Sym, T>>(data_).rest;
    }

    const std::optional<failure>&
    hint() const {
      return std::get<success<Sym, T>>(data_).hint;
    }

    const failure&
    error() const {
      return std::get<failure>(data_);
    }

  private:
    std::variant<success<Sym, T>, failure> data_;
  };

  template <typename Sym, typename T>
  class parser {
  public:
    using symbol_type = Sym;
    using value_type = T;
    using function_type = std::function<reply<Sym, T>(const input<Sym>&)>;

    parser() = default;

    explicit parser(function_type fn) : fn_(std::move(fn)) {}

    reply<Sym, T>
    operator()(const input<Sym>& in) const {
      return fn_(in);
    }

  private:
    function_type fn_;
  };

  // Pick the more specific of two uncommitted failures: the one that got
  // further, or both expectations when they stopped at the same place.
  inline failure
  merge(const failure& a, const failure& b) {
    if (a.position > b.position) return a;
    if (b.position > a.position) return b;
    if (a.expected == b.expected || b.expected.empty()) return a;
    if (a.expected.empty()) return b;
    return failure{a.expected + " or " + b.expected, a.position, false};
  }

  inline std::optional<failure>
  merge_hints(const std::optional<failure>& a,
              const std::optional<failure>& b) {
    if (!a) return b;
    if (!b) return a;
    return merge(*a, *b);
  }

  // Drops a hint left behind once the input has moved past it.
  inline std::optional<failure>
  pending(std::optional<failure> hint, std::size_t at) {
    if (hint && hint->position < at) return std::nullopt;
    return hint;
  }

  // -- Primitives -------------------------------------------------------------

  template <typename Sym, typename T>
  parser<Sym, T>
  pure(T value) {
    return parser<Sym, T>(
        [value = std::move(value)](const input<Sym>& in) -> reply<Sym, T> {
          return success<Sym, T>{value, in};
        });
  }

  template <typename Sym, typename Pred>
  parser<Sym, Sym>
  satisfy(Pred pred, std::string label) {
    return parser<Sym, Sym>(
        [pred = std::move(pred),
         label = std::move(label)](const input<Sym>& in) -> reply<Sym, Sym> {
          if (!in.at_end() && pred(in.peek()))
            return success<Sym, Sym>{in.peek(), in.advance()};
          return failure{label, in.position(), false};
        });
  }

  // Matches the whole of `text` or nothing.
  inline parser<char, std::string>
  literal(std::string text) {
    return parser<char, std::string>(
        [text = std::move(text)](
            const input<char>& in) -> reply<char, std::string> {
          auto cur = in;
          for (char c : text) {
            if (cur.at_end() || cur.peek() != c)
              return failure{"'" + text + "'", in.position(), false};
            cur = cur.advance();
          }
          return success<char, std::string>{text, cur};
        });
  }

  template <typename Sym>
  parser<Sym, std::monostate>
  end_of_input(std::string label = "end of input") {
    return parser<Sym, std::monostate>(
        [label = std::move(label)](
            const input<Sym>& in) -> reply<Sym, std::monostate> {
          if (in.at_end()) return success<Sym, std::monostate>{{}, in};
          return failure{label, in.position(), false};
        });
  }

  // Current cursor position; consumes nothing.
  template <typename Sym>
  parser<Sym, std::size_t>
  position() {
    return parser<Sym, std::size_t>(
        [](const input<Sym>& in) -> reply<Sym, std::size_t> {
          return success<Sym, std::size_t>{in.position(), in};
        });
  }

  // Late-bound reference to a parser owned elsewhere, for recursive rules.
  // The referenced parser must outlive the returned one.
  template <typename Sym, typename T>
  parser<Sym, T>
  defer(const parser<Sym, T>* target) {
    return parser<Sym, T>(
        [target](const input<Sym>& in) { return (*target)(in); });
  }

  // -- Sequencing -------------------------------------------------------------

  template <typename Sym, typename A, typename B, typename F>
  auto
  seq(parser<Sym, A> p, parser<Sym, B> q, F combine)
      -> parser<Sym, std::invoke_result_t<F, A, B>> {
    using R = std::invoke_result_t<F, A, B>;
    return parser<Sym, R>(
        [p = std::move(p), q = std::move(q), combine = std::move(combine)](
            const input<Sym>& in) -> reply<Sym, R> {
          auto a = p(in);
          if (!a.ok()) return a.error();
          auto b = q(a.rest());
          if (!b.ok()) {
            failure err = b.error();
            if (!err.committed && a.hint()) err = merge(*a.hint(), err);
            err.committed =
                err.committed || a.rest().position() != in.position();
            return err;
          }
          auto rest = b.rest();
          auto hint =
              pending(merge_hints(a.hint(), b.hint()), rest.position());
          return success<Sym, R>{combine(a.take(), b.take()), rest,
                                 std::move(hint)};
        });
  }

  template <typename Sym, typename A, typename B>
  parser<Sym, A>
  left(parser<Sym, A> p, parser<Sym, B> q) {
    return seq(std::move(p), std::move(q), [](A a, B) { return a; });
  }

  template <typename Sym, typename A, typename B>
  parser<Sym, B>
  right(parser<Sym, A> p, parser<Sym, B> q) {
    return seq(std::move(p), std::move(q), [](A, B b) { return b; });
  }

  template <typename Sym, typename T, typename F>
  auto
  map(parser<Sym, T> p, F f) -> parser<Sym, std::invoke_result_t<F, T>> {
    using R = std::invoke_result_t<F, T>;
    return parser<Sym, R>([p = std::move(p), f = std::move(f)](
                              const input<Sym>& in) -> reply<Sym, R> {
      auto r = p(in);
      if (!r.ok()) return r.error();
      auto rest = r.rest();
      auto hint = r.hint();
      return success<Sym, R>{f(r.take()), rest, std::move(hint)};
    });
  }

  // -- Choice -----------------------------------------------------------------

  template <typename Sym, typename T>
  parser<Sym, T>
  alt(parser<Sym, T> p, parser<Sym, T> q) {
    return parser<Sym, T>([p = std::move(p), q = std::move(q)](
                              const input<Sym>& in) -> reply<Sym, T> {
      auto first = p(in);
      if (first.ok() || first.error().committed) return first;
      auto second = q(in);
      if (second.ok()) {
        auto rest = second.rest();
        auto hint = pending(merge_hints(first.error(), second.hint()),
                            rest.position());
        return success<Sym, T>{second.take(), rest, std::move(hint)};
      }
      if (second.error().committed) return second;
      return merge(first.error(), second.error());
    });
  }

  template <typename Sym, typename T, typename... Rest>
  parser<Sym, T>
  alt(parser<Sym, T> p, parser<Sym, T> q, Rest... rest) {
    return alt(alt(std::move(p), std::move(q)), std::move(rest)...);
  }

  template <typename Sym, typename T>
  parser<Sym, T>
  attempt(parser<Sym, T> p) {
    return parser<Sym, T>(
        [p = std::move(p)](const input<Sym>& in) -> reply<Sym, T> {
          auto r = p(in);
          if (r.ok()) return r;
          failure err = r.error();
          err.position = in.position();
          err.committed = false;
          return err;
        });
  }

  template <typename Sym, typename T>
  parser<Sym, T>
  label(parser<Sym, T> p, std::string name) {
    return parser<Sym, T>([p = std::move(p), name = std::move(name)](
                              const input<Sym>& in) -> reply<Sym, T> {
      auto r = p(in);
      if (r.ok()) {
        if (!r.hint() || r.rest().position() != in.position()) return r;
        auto rest = r.rest();
        return success<Sym, T>{r.take(), rest,
                               failure{name, in.position(), false}};
      }
      if (r.error().committed) return r;
      return failure{name, in.position(), false};
    });
  }

  // -- Repetition -------------------------------------------------------------

  template <typename Sym, typename T>
  parser<Sym, std::vector<T>>
  many(parser<Sym, T> p) {
    return parser<Sym, std::vector<T>>(
        [p = std::move(p)](
            const input<Sym>& in) -> reply<Sym, std::vector<T>> {
          std::vector<T> values;
          std::optional<failure> hint;
          auto cur = in;
          for (;;) {
            auto r = p(cur);
            if (!r.ok()) {
              if (r.error().committed) return r.error();
              hint = merge_hints(hint, r.error());
              break;
            }
            auto next = r.rest();
            bool moved = next.position() != cur.position();
            hint = merge_hints(hint, r.hint());
            values.push_back(r.take());
            cur = next;
            if (!moved) break;
          }
          return success<Sym, std::vector<T>>{
              std::move(values), cur, pending(std::move(hint), cur.position())};
        });
  }

  template <typename Sym, typename T>
  parser<Sym, std::optional<T>>
  optional(parser<Sym, T> p) {
    return parser<Sym, std::optional<T>>(
        [p = std::move(p)](
            const input<Sym>& in) -> reply<Sym, std::optional<T>> {
          auto r = p(in);
          if (r.ok()) {
            auto rest = r.rest();
            auto hint = r.hint();
            return success<Sym, std::optional<T>>{r.take(), rest,
                                                  std::move(hint)};
          }
          if (r.error().committed) return r.error();
          return success<Sym, std::optional<T>>{std::nullopt, in, r.error()};
        });
  }

  // `first` followed by `others`, collected into one vector.
  template <typename Sym, typename T>
  parser<Sym, std::vector<T>>
  many1_from(parser<Sym, T> first, parser<Sym, std::vector<T>> others) {
    return seq(std::move(first), std::move(others),
               [](T head, std::vector<T> tail) {
                 std::vector<T> values;
                 values.reserve(tail.size() + 1);
                 values.push_back(std::move(head));
                 for (auto& v : tail)
                   values.push_back(std::move(v));
                 return values;
               });
  }

  template <typename Sym, typename T>
  parser<Sym, std::vector<T>>
  many1(parser<Sym, T> p) {
    auto others = many(p);
    return many1_from(std::move(p), std::move(others));
  }

  // One or more `p` separated by `delim`. A trailing delimiter is a
  // committed failure.
  template <typename Sym, typename T, typename D>
  parser<Sym, std::vector<T>>
  sep_by1(parser<Sym, T> p, parser<Sym, D> delim) {
    auto others = many(right(std::move(delim), p));
    return many1_from(std::move(p), std::move(others));
  }

} // namespace yeb::pc
