// file      : libwasixcc/filesystem.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_FILESYSTEM_HXX
#define LIBWASIXCC_FILESYSTEM_HXX

#include <libbutl/filesystem.hxx>

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

// Higher-level filesystem utilities built on top of <libbutl/filesystem.hxx>.
//
// Compared to the libbutl's versions, these handle errors and issue
// diagnostics. They also print the corresponding command line equivalent at
// the specified verbosity level.
//
namespace wasixcc
{
  using butl::auto_rmdir;

  // Create the directory with parents and print the standard diagnostics
  // starting from the specified verbosity level. Do nothing if it already
  // exists.
  //
  void
  mkdir_p (const dir_path&, uint16_t verbosity);

  // Remove the file or symlink (but not the symlink target) if it exists.
  //
  void
  rmfile (const path&, uint16_t verbosity);

  // Create the symlink pointing to the target.
  //
  void
  make_symlink (const path& target, const path& link, uint16_t verbosity);

  // Create a new temporary directory with the specified name prefix and
  // arrange for it to be removed recursively by the auto_rmdir object on
  // destruction. If the directory is left over from an abnormally terminated
  // run, then clean it up and reuse.
  //
  void
  create_temp_dir (auto_rmdir&, const char* prefix);
}

#endif // LIBWASIXCC_FILESYSTEM_HXX
