// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * lib/message.h
 *   logging functions
 *
 * Copyright 2013 Dan R. K. Ports  <drkp@cs.washington.edu>
 * Copyright 2009-2012 Massachusetts Institute of Technology
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use, copy,
 * modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 **********************************************************************/

#ifndef LIB_MESSAGE_H_
#define LIB_MESSAGE_H_

#include <cstdarg>
#include <cstdio>

enum Message_Type {
  MSG_PANIC,
  MSG_WARNING,
  MSG_NOTICE,
  MSG_DEBUG,

  MSG_NUM_TYPES,

  MSG_PERROR = 1 << 16,
};

// Debug messages are compiled in but only printed for source files matching
// one of the comma-separated patterns in the DEBUG environment variable
// (e.g. DEBUG=kv_client.cc or DEBUG=all). A leading '^' excludes a pattern.
#define Debug(msg...)                                           \
  do {                                                          \
    if (Message_DebugEnabled(__FILE__)) {                       \
      _Message(MSG_DEBUG, __FILE__, __LINE__, __func__, msg);   \
    }                                                           \
  } while (0)

#define Notice(msg...) \
  _Message(MSG_NOTICE, __FILE__, __LINE__, __func__, msg)

#define Warning(msg...) \
  _Message(MSG_WARNING, __FILE__, __LINE__, __func__, msg)

#define PWarning(msg...) \
  _Message((Message_Type)(MSG_WARNING | MSG_PERROR), __FILE__, __LINE__, \
           __func__, msg)

#define Panic(msg...)                                         \
  do {                                                        \
    _Message(MSG_PANIC, __FILE__, __LINE__, __func__, msg);   \
    _Panic();                                                 \
  } while (0)

#define PPanic(msg...)                                                   \
  do {                                                                   \
    _Message((Message_Type)(MSG_PANIC | MSG_PERROR), __FILE__, __LINE__, \
             __func__, msg);                                             \
    _Panic();                                                            \
  } while (0)

#define NOT_REACHABLE() Panic("Unreachable code reached")

#define Message_DebugEnabled(fname) _Message_DebugEnabled(fname)

void _Message(enum Message_Type type, const char *fname, int line,
              const char *func, const char *fmt, ...)
    __attribute__((format(printf, 5, 6)));
void _Message_VA(enum Message_Type type, FILE *fp, const char *fname,
                 int line, const char *func, const char *fmt, va_list args);
void Message_VA(enum Message_Type type, const char *fname, int line,
                const char *func, const char *fmt, va_list args);
bool _Message_DebugEnabled(const char *fname);

void _Panic() __attribute__((noreturn));
void Backtrace();

#endif  // LIB_MESSAGE_H_
