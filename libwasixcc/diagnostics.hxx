// file      : libwasixcc/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_DIAGNOSTICS_HXX
#define LIBWASIXCC_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

namespace wasixcc
{
  struct diag_record;

  // Throw this exception to terminate the driver. The handler should assume
  // that the diagnostics has already been issued.
  //
  class failed: public std::exception {};

  // Print the process command line. The arguments are NULL-terminated.
  //
  void
  print_process (diag_record&, const char* const* args);

  void
  print_process (const char* const* args);

  // Driver verbosity level (-sVERBOSITY=<level> or WASIXCC_VERBOSITY).
  //
  // 0 - disabled
  // 1 - high-level information messages
  // 2 - essential underlying commands that are being executed
  // 3 - all underlying commands that are being executed
  // 4 - information helpful to the user (e.g., how arguments were classified)
  // 5 - information helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //

  // Forward-declarated in <libwasixcc/utility.hxx>.
  //
  // const uint16_t verb_never = 7;
  // extern uint16_t verb;

  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}

  // Diagnostic facility, base infrastructure.
  //
  using butl::diag_stream;
  using butl::diag_epilogue;
  using butl::diag_frame;

  template <typename> struct diag_prologue;
  template <typename> struct diag_mark;

  struct diag_record: butl::diag_record
  {
    template <typename T>
    const diag_record&
    operator<< (const T& x) const
    {
      os << x;
      return *this;
    }

    diag_record () = default;

    template <typename B>
    explicit
    diag_record (const diag_prologue<B>& p): diag_record () { *this << p;}

    template <typename B>
    explicit
    diag_record (const diag_mark<B>& m): diag_record () { *this << m;}
  };

  template <typename B>
  struct diag_prologue: butl::diag_prologue<B>
  {
    using butl::diag_prologue<B>::diag_prologue;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      diag_record r;
      r.append (this->indent, this->epilogue);
      B::operator() (r);
      r << x;
      return r;
    }

    friend const diag_record&
    operator<< (const diag_record& r, const diag_prologue& p)
    {
      r.append (p.indent, p.epilogue);
      p (r);
      return r;
    }
  };

  template <typename B>
  struct diag_mark: butl::diag_mark<B>
  {
    using butl::diag_mark<B>::diag_mark;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      return B::operator() () << x;
    }

    friend const diag_record&
    operator<< (const diag_record& r, const diag_mark& m)
    {
      return r << m ();
    }
  };

  template <typename B>
  struct diag_noreturn_end: butl::diag_noreturn_end<B>
  {
    diag_noreturn_end () {} // For Clang 3.7 (const needs user default ctor).

    using butl::diag_noreturn_end<B>::diag_noreturn_end;

    [[noreturn]] friend void
    operator<< (const diag_record& r, const diag_noreturn_end& e)
    {
      assert (r.full ());
      e.B::operator() (r);
    }
  };

  // Diagnostic facility, project specifics.
  //
  // All diagnostics is prefixed with the driver name so that it can be
  // told apart from the underlying tools' output, for example:
  //
  // wasixcc: error: no input files
  //
  struct simple_prologue_base
  {
    explicit
    simple_prologue_base (const char* type,
                          const char* mod,
                          const char* name)
        : type_ (type), mod_ (mod), name_ (name) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* mod_;
    const char* name_;
  };

  struct basic_mark_base
  {
    using simple_prologue = diag_prologue<simple_prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     diag_epilogue* epilogue = &diag_frame::apply,
                     const char* mod = nullptr,
                     const char* name = nullptr)
        : type_ (type), mod_ (mod), name_ (name),
          epilogue_ (epilogue) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (epilogue_, type_, mod_, name_);
    }

  protected:
    const char* type_;
    const char* mod_;
    const char* name_;
    diag_epilogue* const epilogue_;
  };
  using basic_mark = diag_mark<basic_mark_base>;

  extern const basic_mark error;
  extern const basic_mark warn;
  extern const basic_mark info;
  extern const basic_mark text;

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : trace_mark_base (nullptr, name) {}

    trace_mark_base (const char* mod, const char* name)
        : basic_mark_base ("trace",
                           nullptr, // No diag stack.
                           mod,
                           name) {}
  };
  using trace_mark = diag_mark<trace_mark_base>;
  using tracer = trace_mark;

  // fail
  //
  struct fail_mark_base: basic_mark_base
  {
    explicit
    fail_mark_base (const char* type)
        : basic_mark_base (type,
                           [](const butl::diag_record& r, butl::diag_writer* w)
                           {
                             diag_frame::apply (r);
                             r.flush (w);
                             throw failed ();
                           },
                           nullptr,
                           nullptr) {}
  };
  using fail_mark = diag_mark<fail_mark_base>;

  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // If we just throw then the record's destructor will see an active
      // exception and will not flush the record.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = diag_noreturn_end<fail_end_base>;

  extern const fail_mark fail;
  extern const fail_end  endf;
}

#endif // LIBWASIXCC_DIAGNOSTICS_HXX
