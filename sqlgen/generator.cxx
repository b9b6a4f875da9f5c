// file      : sqlgen/generator.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <map>
#include <sstream>

#include <cutl/compiler/code-stream.hxx>
#include <cutl/compiler/cxx-indenter.hxx>

#include <sqlgen/context.hxx>
#include <sqlgen/generate.hxx>
#include <sqlgen/parallel.hxx>
#include <sqlgen/generator.hxx>
#include <sqlgen/semantics/relational/name.hxx>

using namespace std;
using namespace cutl;

namespace
{
  typedef void (*emitter) (target::entity const&);
  typedef string (context::*namer) (target::entity const&) const;

  // Run the emitter with a new root context for this thread writing
  // through the C++ indenter.
  //
  pair<string, string>
  emit (options const& ops, target::entity const& e, namer n, emitter f)
  {
    ostringstream os;
    string name;

    {
      context ctx (os, ops);
      compiler::ostream_filter<compiler::cxx_indenter, char> ind (os);

      name = (ctx.*n) (e);
      f (e);
    }

    return make_pair (name, os.str ());
  }

  struct generate_entity
  {
    generate_entity (generator const& g,
                     target::entities const& es,
                     vector<generator::entity_artifacts>& r)
        : g_ (g), es_ (es), r_ (r)
    {
    }

    void
    operator() (size_t i) const
    {
      r_[i] = g_.generate (es_[i]);
    }

  private:
    generator const& g_;
    target::entities const& es_;
    vector<generator::entity_artifacts>& r_;
  };

  char const*
  kind (target::entity const& e)
  {
    switch (e.kind)
    {
    case target::entity::table: return "table";
    case target::entity::view: return "view";
    case target::entity::values: return "value set";
    }

    return "";
  }
}

generator::
generator (options const& ops)
    : ops_ (ops)
{
}

generator::entity_artifacts generator::
generate (target::entity const& e) const
{
  entity_artifacts r;

  if (e.kind != target::entity::values)
  {
    r.push_back (emit (ops_, e, &context::hxx_name, &row::generate_header));
    return r;
  }

  r.push_back (emit (ops_, e, &context::hxx_name, &values::generate_header));
  r.push_back (emit (ops_, e, &context::data_name, &values::generate_data));
  r.push_back (
    emit (ops_, e, &context::serialization_name,
          &values::generate_serialization));

  return r;
}

artifacts generator::
generate (target::model const& m, diagnostics& d) const
{
  target::entities const& es (m.ents);
  vector<entity_artifacts> eas (es.size ());

  run_parallel (es.size (), ops_.jobs (), generate_entity (*this, es, eas));

  // Merge in the entity order. Names are compared case-insensitively
  // since the artifacts may end up on a case-insensitive file system.
  //
  artifacts r;
  map<string, size_t> owners;

  for (size_t i (0); i != es.size (); ++i)
  {
    entity_artifacts const& ea (eas[i]);

    for (entity_artifacts::const_iterator j (ea.begin ());
         j != ea.end (); ++j)
    {
      pair<map<string, size_t>::iterator, bool> p (
        owners.insert (
          make_pair (semantics::relational::ukey (j->first), i)));

      if (!p.second)
      {
        target::entity const& o (es[p.first->second]);

        error (d, diagnostic::output_collision, es[i].loc)
          << "artifact '" << j->first << "' of " << kind (es[i]) << " '"
          << es[i].qualified << "' collides with an artifact of "
          << kind (o) << " '" << o.qualified << "'" << endl;

        info (d, diagnostic::output_collision, o.loc)
          << kind (o) << " '" << o.qualified << "' is declared here"
          << endl;

        continue;
      }

      r.insert (*j);
    }
  }

  return r;
}
