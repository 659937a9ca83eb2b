//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_LOGGER_HPP
#define WAYPOINT_LOGGER_HPP

#include <waypoint/detail/config.hpp>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace waypoint {

/** A named logging section

    Sections are cheap handles which refer to shared
    state. Messages are formatted by replacing each
    `{}` in the format string with the next argument,
    written with `operator<<`.

    @par Example
    @code
    auto sect = log_sections::global().get("waypoint.router");
    WAYPOINT_LOG_DBG(sect)("defined route {} {}", methods, path);
    @endcode
*/
class section
{
public:
    WAYPOINT_DECL
    section() noexcept;

    /** Return the level below which logging is squelched
    */
    int threshold() const noexcept
    {
        return impl_ ? impl_->level : off;
    }

    /** Set the level below which logging is squelched
    */
    WAYPOINT_DECL
    void set_threshold(int level) noexcept;

    /** Return the name of the section
    */
    WAYPOINT_DECL
    std::string_view name() const noexcept;

    template<class... Args>
    void operator()(
        std::string_view fs,
        Args const&... args) const
    {
        if(! impl_)
            return;
        constexpr auto N = sizeof...(Args);
        if constexpr(N == 0)
        {
            format_impl(fs, nullptr, nullptr, 0);
        }
        else
        {
            std::size_t len[N];
            std::stringstream ss;
            write(ss, len, args...);
            std::string s(ss.str());
            format_impl(fs, s.data(), len, N);
        }
    }

    /// The threshold of a section which logs nothing
    static constexpr int off = 6;

private:
    template<class T1, class T2, class... TN>
    static void write(
        std::stringstream& ss,
        std::size_t* plen,
        T1 const& t1,
        T2 const& t2,
        TN const&... tn)
    {
        auto const n0 = ss.tellp();
        ss << t1;
        *plen = static_cast<std::size_t>(ss.tellp() - n0);
        write(ss, ++plen, t2, tn...);
    }

    template<class T>
    static void write(
        std::stringstream& ss,
        std::size_t* plen,
        T const& t)
    {
        auto const n0 = ss.tellp();
        ss << t;
        *plen = static_cast<std::size_t>(ss.tellp() - n0);
    }

    WAYPOINT_DECL
    void format_impl(std::string_view,
        char const*, std::size_t*, std::size_t n) const;

    explicit section(std::string_view name, int level);

    friend class log_sections;

    struct impl
    {
        std::string name;
        int level = off;
    };

    std::shared_ptr<impl> impl_;
};

//------------------------------------------------

/** A collection of log sections

    Sections created through the global collection have
    their initial threshold taken from the `WAYPOINT_DEBUG`
    environment variable, a comma separated list of
    section names in which `*` enables every section.
    Enabled sections log at trace level; all others
    start squelched.
*/
class log_sections
{
public:
    /** Destructor
    */
    WAYPOINT_DECL
    ~log_sections();

    /** Constructor

        @param enabled The comma separated list of
        section names to enable, or `*` for all.
    */
    WAYPOINT_DECL
    explicit
    log_sections(std::string_view enabled = {});

    log_sections(log_sections const&) = delete;
    log_sections& operator=(log_sections const&) = delete;

    /** Return a log section by name.

        If the section does not already exist, it is created.
        The name is case sensitive.
    */
    WAYPOINT_DECL
    section
    get(std::string_view name);

    /** Return the process-wide collection
    */
    WAYPOINT_DECL
    static
    log_sections&
    global();

private:
    struct impl;
    impl* impl_;
};

//------------------------------------------------

#ifndef WAYPOINT_LOG_AT_LEVEL
#define WAYPOINT_LOG_AT_LEVEL(sect, level) \
    if((level) < (sect).threshold()) {} else sect
#endif

/// Log at trace level
#ifndef WAYPOINT_LOG_TRC
#define WAYPOINT_LOG_TRC(sect) WAYPOINT_LOG_AT_LEVEL(sect, 0)
#endif

/// Log at debug level
#ifndef WAYPOINT_LOG_DBG
#define WAYPOINT_LOG_DBG(sect) WAYPOINT_LOG_AT_LEVEL(sect, 1)
#endif

/// Log at info level (normal)
#ifndef WAYPOINT_LOG_INF
#define WAYPOINT_LOG_INF(sect) WAYPOINT_LOG_AT_LEVEL(sect, 2)
#endif

/// Log at warning level
#ifndef WAYPOINT_LOG_WRN
#define WAYPOINT_LOG_WRN(sect) WAYPOINT_LOG_AT_LEVEL(sect, 3)
#endif

/// Log at error level
#ifndef WAYPOINT_LOG_ERR
#define WAYPOINT_LOG_ERR(sect) WAYPOINT_LOG_AT_LEVEL(sect, 4)
#endif

/// Log at fatal level
#ifndef WAYPOINT_LOG_FTL
#define WAYPOINT_LOG_FTL(sect) WAYPOINT_LOG_AT_LEVEL(sect, 5)
#endif

} // waypoint

#endif
