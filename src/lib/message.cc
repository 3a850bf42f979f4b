// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * message.cc:
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

#include "lib/message.h"

#include <execinfo.h>
#include <fnmatch.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>

namespace {

struct MessageDesc {
  const char *prefix;
  const char *color;
};

const MessageDesc kMessageDescs[MSG_NUM_TYPES + 1] = {
    {"PANIC", "1;31"},
    {"!", "1;33"},
    {"*", nullptr},
    {" ", "22;37"},
    {"<Invalid message type>", nullptr},
};

// Patterns parsed once from the DEBUG environment variable.
struct DebugPatterns {
  bool parsed = false;
  std::vector<std::string> pats;
};

DebugPatterns &GetDebugPatterns() {
  static DebugPatterns patterns;
  if (!patterns.parsed) {
    patterns.parsed = true;
    const char *env = getenv("DEBUG");
    if (env != nullptr && strlen(env) != 0u) {
      std::string pat;
      for (const char *c = env; *c != '\0'; ++c) {
        if (*c == ',' || *c == ' ') {
          if (!pat.empty()) {
            patterns.pats.push_back(pat);
          }
          pat.clear();
        } else {
          pat.push_back(*c);
        }
      }
      if (!pat.empty()) {
        patterns.pats.push_back(pat);
      }
    }
  }
  return patterns;
}

}  // namespace

void __attribute__((weak))
Message_VA(enum Message_Type type, const char *fname, int line,
           const char *func, const char *fmt, va_list args) {
  _Message_VA(type, stderr, fname, line, func, fmt, args);
}

void _Message(enum Message_Type type, const char *fname, int line,
              const char *func, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  Message_VA(type, fname, line, func, fmt, args);
  va_end(args);
}

void _Message_VA(enum Message_Type type, FILE *fp, const char *fname, int line,
                 const char *func, const char *fmt, va_list args) {
  static int haveColor = -1;
  // errno may be clobbered by the formatting below
  int savedErrno = errno;

  if (haveColor == -1) {
    haveColor = isatty(fileno(fp));
  }

  int nDesc = type & (~MSG_PERROR);
  if (nDesc > MSG_NUM_TYPES) {
    nDesc = MSG_NUM_TYPES;
  }
  const MessageDesc &desc = kMessageDescs[nDesc];

  char buf[2048];
  size_t used = 0;
  auto append = [&buf, &used](int n) {
    if (n > 0) {
      used += static_cast<size_t>(n);
      if (used >= sizeof(buf)) {
        used = sizeof(buf) - 1;
      }
    }
  };

  struct timeval tv {};
  if (gettimeofday(&tv, nullptr) >= 0) {
    struct tm tmbuf {};
    struct tm *tm = localtime_r(&tv.tv_sec, &tmbuf);
    append(snprintf(buf + used, sizeof(buf) - used,
                    "%04d%02d%02d-%02d%02d%02d-%04d %05d ",
                    1900 + tm->tm_year, tm->tm_mon + 1, tm->tm_mday,
                    tm->tm_hour, tm->tm_min, tm->tm_sec,
                    static_cast<int>(tv.tv_usec / 100), getpid()));
  }

  append(snprintf(buf + used, sizeof(buf) - used, "%s ", desc.prefix));

  if (fname != nullptr) {
    const char *fbasename = strrchr(fname, '/');
    fbasename = fbasename != nullptr ? fbasename + 1 : fname;
    char filepos[64];
    snprintf(filepos, sizeof(filepos), "(%s:%d):", fbasename, line);
    append(snprintf(buf + used, sizeof(buf) - used, "%-15s %-24s ",
                    func != nullptr ? func : "", filepos));
  }

  append(vsnprintf(buf + used, sizeof(buf) - used, fmt, args));

  if ((type & MSG_PERROR) != 0) {
    append(snprintf(buf + used, sizeof(buf) - used, ": %s",
                    strerror(savedErrno)));
  }

  if (haveColor != 0 && desc.color != nullptr) {
    fprintf(fp, "\033[%sm%s\033[0m\n", desc.color, buf);
  } else {
    fprintf(fp, "%s\n", buf);
  }
  fflush(fp);
}

void _Panic() {
  Backtrace();
  abort();
}

void Backtrace() {
  void *bt[100];
  int size = backtrace(bt, 100);
  char **strings = backtrace_symbols(bt, size);
  if (strings != nullptr) {
    for (int i = 0; i < size; ++i) {
      Warning("%s", strings[i]);
    }
    free(strings);
  }
}

bool _Message_DebugEnabled(const char *fname) {
  const DebugPatterns &patterns = GetDebugPatterns();
  if (patterns.pats.empty()) {
    return false;
  }

  bool result = false;
  if (patterns.pats[0] == "all" || patterns.pats[0][0] == '^') {
    result = true;
  }

  const char *fbasename = strrchr(fname, '/');
  if (fbasename != nullptr) {
    ++fbasename;
  }
  for (const auto &pat : patterns.pats) {
    bool exclude = pat[0] == '^';
    const char *p = exclude ? pat.c_str() + 1 : pat.c_str();

    if (fnmatch(p, fname, FNM_PATHNAME) == 0 ||
        (fbasename != nullptr && fnmatch(p, fbasename, FNM_PATHNAME) == 0)) {
      result = !exclude;
    }
  }
  return result;
}
