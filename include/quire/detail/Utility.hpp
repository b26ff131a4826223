/* Utility.hpp
Small helpers shared by the store implementation
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_UTILITY_HPP
#define QUIRE_UTILITY_HPP

#include "ErrorHandling.hpp"
#include <cstdio>
#include <memory>
#include <ostream>
#include <utility>
#include <functional>

// Define this to have every part of quire print, in extremely terse text, what it is doing and why.
#if (defined(QUIRE_DEBUG_PRINTING) && QUIRE_DEBUG_PRINTING)
#define QUIRE_DEBUG_PRINT(...) \
    { \
    fprintf(stderr, __VA_ARGS__); \
    }
#else
#define QUIRE_DEBUG_PRINT(...)
#endif

QUIRE_V1_NAMESPACE_BEGIN

  namespace detail {
    // Support for make_unique. I keep wishing it was already here!
    template<class T, class... Args>
    std::unique_ptr<T> make_unique(Args &&... args){
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }

    // Debug printing of exception info
    inline std::ostream &output_exception_info(std::ostream &os, const std::exception &e)
    {
        return os << "Exception: '" << e.what() << "'";
    }

    //! Writes msg to stderr, for failures which have nowhere else to go
    QUIRE_HEADERS_ONLY_FUNC_SPEC void print_fatal_exception_message_to_stderr(const char *msg);

    //! Calls a callable on scope exit unless dismissed
    template<class callable> class UndoerImpl
    {
        bool _dismissed;
        callable undoer;
        UndoerImpl() = delete;
        UndoerImpl(const UndoerImpl &) = delete;
        UndoerImpl &operator=(const UndoerImpl &) = delete;
        UndoerImpl &operator=(UndoerImpl &&) = delete;
    public:
        explicit UndoerImpl(callable &&c) : _dismissed(false), undoer(std::move(c)) { }
        UndoerImpl(UndoerImpl &&o) : _dismissed(o._dismissed), undoer(std::move(o.undoer)) { o._dismissed=true; }
        ~UndoerImpl()
        {
            if(!_dismissed)
                undoer();
        }
        //! Returns if the Undoer is dismissed
        bool dismissed() const { return _dismissed; }
        //! Dismisses the Undoer
        void dismiss(bool d=true) { _dismissed=d; }
    };
    //! Makes an UndoerImpl, the type of which is usually deduced with auto
    template<class callable> inline UndoerImpl<callable> Undoer(callable c)
    {
        return UndoerImpl<callable>(std::move(c));
    }

  } // namespace

    struct filesystem_hash
    {
        std::hash<filesystem::path::string_type> hasher;
    public:
        size_t operator()(const filesystem::path& p) const
        {
            return hasher(p.native());
        }
    };

QUIRE_V1_NAMESPACE_END

#endif  /* QUIRE_UTILITY_HPP */
