// file      : libwasixcc/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_TYPES_HXX
#define LIBWASIXCC_TYPES_HXX

#include <map>
#include <vector>
#include <string>
#include <utility>          // pair, move()
#include <cstddef>          // size_t
#include <cstdint>          // uint{8,16,32,64}_t
#include <ostream>
#include <functional>       // function
#include <initializer_list>

#include <exception>     // exception
#include <system_error>

#include <libbutl/path.hxx>
#include <libbutl/path-io.hxx>
#include <libbutl/process.hxx>
#include <libbutl/process-io.hxx>
#include <libbutl/optional.hxx>

namespace wasixcc
{
  // Commonly-used types.
  //
  using std::uint8_t;
  using std::uint16_t;
  using std::uint32_t;
  using std::uint64_t;

  using std::size_t;

  using std::pair;
  using std::string;

  using std::function;

  using strings = std::vector<string>;
  using cstrings = std::vector<const char*>;

  using std::initializer_list;

  using std::map;
  using std::vector;

  using std::ostream;
  using std::endl;

  // Exceptions.
  //
  // While <exception> is included, there is no using for std::exception --
  // use qualified.
  //
  using std::system_error;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;

  // <libbutl/path.hxx>
  //
  using butl::path;
  using butl::dir_path;
  using butl::invalid_path;

  using paths = std::vector<path>;

  // <libbutl/process.hxx>
  //
  using butl::process;
  using butl::process_path;
  using butl::process_error;
}

#endif // LIBWASIXCC_TYPES_HXX
