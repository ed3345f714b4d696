#include "Patterns.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <glog/logging.h>

namespace {
constexpr std::string_view file_pfx{"file:"};

std::vector<std::string> read_patterns(std::string const& path)
{
  std::vector<std::string> patterns;

  std::ifstream ifs(path);
  if (!ifs) {
    if (errno != ENOENT)
      LOG(WARNING) << "can't read " << path << ": " << std::strerror(errno);
    return patterns;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    boost::algorithm::trim(line);
    if (line.empty() || (line.front() == '#'))
      continue;
    patterns.push_back(line);
  }

  return patterns;
}
} // namespace

bool Patterns::is_file_ref(std::string_view arg)
{
  return boost::algorithm::starts_with(arg, "/")
         || boost::algorithm::starts_with(arg, "./")
         || boost::algorithm::starts_with(arg, file_pfx);
}

std::vector<std::string> const& Patterns::resolve(std::string const& arg)
{
  auto const it = lists_.find(arg);
  if (it != end(lists_))
    return it->second;

  if (!is_file_ref(arg))
    return lists_.emplace(arg, std::vector<std::string>{arg}).first->second;

  auto const path{boost::algorithm::starts_with(arg, file_pfx)
                      ? arg.substr(file_pfx.size())
                      : arg};

  return lists_.emplace(arg, read_patterns(path)).first->second;
}
