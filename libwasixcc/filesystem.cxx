// file      : libwasixcc/filesystem.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/filesystem.hxx>

#include <libwasixcc/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace wasixcc
{
  void
  mkdir_p (const dir_path& d, uint16_t v)
  {
    // We don't want to print the command if the directory already exists.
    // This makes the below code a bit ugly.
    //
    auto print = [v, &d] (bool ovr)
    {
      if (verb >= v || ovr)
        text << "mkdir -p " << d;
    };

    mkdir_status ms;
    try
    {
      ms = try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      print (true);
      fail << "unable to create directory " << d << ": " << e << endf;
    }

    if (ms == mkdir_status::success)
      print (false);
  }

  void
  rmfile (const path& f, uint16_t v)
  {
    auto print = [v, &f] (bool ovr)
    {
      if (verb >= v || ovr)
        text << "rm " << f;
    };

    rmfile_status rs;
    try
    {
      rs = try_rmfile (f);
    }
    catch (const system_error& e)
    {
      print (true);
      fail << "unable to remove file " << f << ": " << e << endf;
    }

    if (rs == rmfile_status::success)
      print (false);
  }

  void
  make_symlink (const path& t, const path& l, uint16_t v)
  {
    if (verb >= v)
      text << "ln -s " << t << ' ' << l;

    try
    {
      butl::mksymlink (t, l);
    }
    catch (const system_error& e)
    {
      fail << "unable to create symlink " << l << ": " << e;
    }
  }

  void
  create_temp_dir (auto_rmdir& rm, const char* prefix)
  {
    dir_path& td (rm.path);

    assert (td.empty ()); // Must be called once.

    try
    {
      td = dir_path::temp_path (prefix);
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain temporary directory: " << e;
    }

    mkdir_status r;

    try
    {
      r = try_mkdir (td);
    }
    catch (const system_error& e)
    {
      fail << "unable to create temporary directory " << td << ": " << e
           << endf;
    }

    if (r == mkdir_status::already_exists)
    try
    {
      butl::rmdir_r (td, false /* dir */);
    }
    catch (const system_error& e)
    {
      fail << "unable to cleanup temporary directory " << td << ": " << e;
    }

    if (verb >= 3)
      text << "mkdir " << td;
  }
}
