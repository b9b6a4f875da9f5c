// file      : sqlgen/orchestrator.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>  // std::unique_ptr
#include <sstream>

#include <sqlgen/refiner.hxx>
#include <sqlgen/type-map.hxx>
#include <sqlgen/transformer.hxx>
#include <sqlgen/orchestrator.hxx>

using namespace std;

namespace
{
  struct failed {};

  class phase_tracer
  {
  public:
    phase_tracer (logger& l): log_ (l), n_ (0) {}

    void
    start (string const& name)
    {
      ostringstream os;
      os << "phase " << ++n_ << ": " << name;
      log_.log (logger::phase, os.str ());
    }

    void
    trace (string const& m)
    {
      log_.log (logger::trace, m);
    }

    // Throw failed if any errors were recorded so far.
    //
    void
    check (diagnostics const& d)
    {
      if (!d.fatal ())
        return;

      ostringstream os;
      os << "phase " << n_ << " failed with "
         << d.count (diagnostic::error) << " error(s)";
      log_.log (logger::trace, os.str ());

      throw failed ();
    }

  private:
    logger& log_;
    size_t n_;
  };
}

orchestrator::
orchestrator (options const& ops, logger& l)
    : ops_ (ops), log_ (l)
{
}

bool orchestrator::
run (sources const& ss, artifacts& out, diagnostics& d) const
{
  phase_tracer t (log_);

  try
  {
    t.start ("compiling type mapping rules");

    type_map tm (ops_.type_map (), ops_.unknown_type (), d);

    {
      ostringstream os;
      os << tm.size () << " rule(s)";
      t.trace (os.str ());
    }

    t.check (d);

    t.start ("ingesting schema sources");

    raw::models ms;
    {
      ingestor i (ops_);
      ms = i.ingest (ss, d);
    }

    for (raw::models::const_iterator i (ms.begin ()); i != ms.end (); ++i)
    {
      ostringstream os;
      os << i->source << ": " << i->tables.size () << " table(s), "
         << i->views.size () << " view(s), " << i->inserts.size ()
         << " insert(s)";
      t.trace (os.str ());
    }

    t.check (d);

    t.start ("refining schema model");

    unique_ptr<semantics::relational::model> m;
    {
      refiner r (ops_);
      m = r.refine (ms, d);
    }

    t.check (d);

    t.start ("transforming to C++ model");

    unique_ptr<target::model> cm;
    {
      transformer tr (ops_, tm);
      cm = tr.transform (*m, d);
    }

    t.check (d);

    {
      ostringstream os;
      size_t n (cm->ents.size ());
      os << n << " entit" << (n == 1 ? "y" : "ies") << ", "
         << d.count (diagnostic::unmapped_type) << " unmapped column type(s)";
      t.trace (os.str ());
    }

    t.start ("generating code");

    {
      generator g (ops_);
      out = g.generate (*cm, d);
    }

    {
      ostringstream os;
      os << out.size () << " artifact(s)";
      t.trace (os.str ());
    }

    t.check (d);
  }
  catch (failed const&)
  {
    return false;
  }

  return true;
}
