/*

export.hpp
----------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once


#if defined(_WIN32) && defined(UIDBOX_SHARED)
    #if defined(UIDBOX_BUILDING)
        #define UIDBOX_EXPORT __declspec(dllexport)
    #else
        #define UIDBOX_EXPORT __declspec(dllimport)
    #endif
#elif defined(__GNUC__) && defined(UIDBOX_SHARED)
    #define UIDBOX_EXPORT __attribute__((visibility("default")))
#else
    #define UIDBOX_EXPORT
#endif
