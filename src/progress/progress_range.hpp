#pragma once
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "ProgressBar.hpp"
#include "Spinner.hpp"

namespace LineGauge {

namespace detail {
template <typename R, typename = void>
struct has_size : std::false_type {};

template <typename R>
struct has_size<R, std::void_t<decltype(std::size(std::declval<R&>()))>> : std::true_type {};
} // namespace detail

// Lazy view over a range that advances a ProgressBar by one for every element
// consumed. Ranges without a size get a Spinner instead.
//
// The indicator is created by begin() and closed by the destructor, so leaving
// the loop early (break, return, exception) still finishes the display.
// Calling begin() again restarts from zero, which only makes sense if the
// underlying range can be iterated again.
//
//     for (auto& x : LineGauge::progress_bar(items, "Processing")) { ... }
template <typename Range>
class ProgressRange {
    public:
    using underlying_iterator = decltype(std::begin(std::declval<Range&>()));
    using underlying_sentinel = decltype(std::end(std::declval<Range&>()));

    class sentinel {
        public:
        explicit sentinel(underlying_sentinel end) : m_end(std::move(end)) {}
        const underlying_sentinel& base() const { return m_end; }
        private:
        underlying_sentinel m_end;
    };

    class iterator {
        public:
        iterator(underlying_iterator it, ProgressBar* bar) : m_it(std::move(it)), m_bar(bar) {}

        decltype(auto) operator*() const { return *m_it; }

        iterator& operator++() {
            ++m_it;
            if (m_bar) {
                m_bar->update(1);
            }
            return *this;
        }

        friend bool operator==(const iterator& it, const sentinel& s) { return it.m_it == s.base(); }
        friend bool operator!=(const iterator& it, const sentinel& s) { return !(it == s); }

        private:
        underlying_iterator m_it;
        ProgressBar* m_bar;
    };

    ProgressRange(Range&& range, BarOptions options, OutputSink& sink)
        : m_range(std::forward<Range>(range)), m_options(std::move(options)), m_sink(sink) {}

    ~ProgressRange() { close(); }

    ProgressRange(const ProgressRange&) = delete;
    ProgressRange& operator=(const ProgressRange&) = delete;

    iterator begin() {
        close();
        if constexpr (detail::has_size<Range>::value) {
            const auto n = std::size(m_range);
            m_bar = std::make_unique<ProgressBar>(static_cast<int64_t>(n), m_options, m_sink);
        } else {
            m_spinner = std::make_unique<Spinner>(m_options.description, m_sink);
            m_spinner->start();
        }
        return iterator(std::begin(m_range), m_bar.get());
    }

    sentinel end() { return sentinel(std::end(m_range)); }

    void close() {
        if (m_bar) {
            m_bar->close();
        }
        if (m_spinner) {
            m_spinner->stop();
        }
    }

    // nullptr before begin() and for unsized ranges
    const ProgressBar* bar() const { return m_bar.get(); }

    private:
    Range m_range; // a reference for lvalue ranges, owned for rvalues
    BarOptions m_options;
    OutputSink& m_sink;
    std::unique_ptr<ProgressBar> m_bar;
    std::unique_ptr<Spinner> m_spinner;
};

template <typename Range>
ProgressRange<Range> progress_bar(Range&& range, const std::string& description = "Progress",
                                  BarOptions options = {}, OutputSink& sink = OutputSink::console()) {
    options.description = description;
    return ProgressRange<Range>(std::forward<Range>(range), std::move(options), sink);
}

} // namespace LineGauge
