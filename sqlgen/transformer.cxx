// file      : sqlgen/transformer.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <map>
#include <set>
#include <vector>
#include <sstream>
#include <utility>   // std::move
#include <algorithm> // std::stable_sort

#include <sqlgen/context.hxx>
#include <sqlgen/transformer.hxx>
#include <sqlgen/traversal/relational.hxx>

using namespace std;

namespace relational = semantics::relational;

using relational::qname;

namespace
{
  typedef set<string> name_set;

  // Escape the name and make it unique in the set by appending a
  // number. If the suffix is not empty, then the name of the data
  // member (name plus suffix) generated alongside the accessor must
  // be unique as well and is reserved too.
  //
  string
  unique_name (string const& n, name_set& used, char const* suffix = "")
  {
    string b (context::escape (n));
    string r (b);

    for (size_t i (1);
         used.find (r) != used.end () || used.find (r + suffix) != used.end ();
         ++i)
    {
      ostringstream os;
      os << b << i;
      r = os.str ();
    }

    used.insert (r);
    used.insert (r + suffix);
    return r;
  }

  // Collapse whitespace runs (including newlines) into single spaces
  // so that the text fits a one-line comment.
  //
  string
  one_line (string const& s)
  {
    string r;
    bool ws (false);

    for (string::const_iterator i (s.begin ()); i != s.end (); ++i)
    {
      if (*i == ' ' || *i == '\t' || *i == '\n' || *i == '\r')
        ws = true;
      else
      {
        if (ws && !r.empty ())
          r += ' ';

        r += *i;
        ws = false;
      }
    }

    return r;
  }

  bool
  ordinal_less (relational::column const* x, relational::column const* y)
  {
    return x->ordinal () < y->ordinal ();
  }

  typedef vector<relational::column*> columns;

  // Collect the scope's columns in the ordinal order.
  //
  struct column_collector: traversal::relational::column
  {
    column_collector (columns& cs): cs_ (cs) {}

    virtual void
    traverse (type& c)
    {
      cs_.push_back (&c);
    }

  private:
    columns& cs_;
  };

  template <typename S>
  columns
  collect (S& s)
  {
    columns r;

    traversal::relational::scope_template<S> scope;
    traversal::relational::names names;
    column_collector c (r);

    scope >> names >> c;
    scope.traverse (s);

    stable_sort (r.begin (), r.end (), &ordinal_less);
    return r;
  }

  // Value set declaration with the table name qualified.
  //
  struct value_set_decl
  {
    value_set_spec spec;
    qname table;
    bool used;
  };

  typedef map<string, value_set_decl> value_set_map;

  qname
  parse_qname (string const& s, string const& default_schema)
  {
    qname r;

    for (string::size_type b (0), p; b <= s.size (); b = p + 1)
    {
      p = s.find ('.', b);

      if (p == string::npos)
        p = s.size ();

      string n (s, b, p - b);

      if (n.size () > 1 &&
          ((n[0] == '[' && n[n.size () - 1] == ']') ||
           (n[0] == '"' && n[n.size () - 1] == '"')))
        n = string (n, 1, n.size () - 2);

      r.append (n);
    }

    // Drop the database part.
    //
    if (r.size () > 2)
    {
      qname q;
      q.append (r[r.size () - 2]);
      q.append (r.uname ());
      r = q;
    }

    return r.qualified () ? r : qname (default_schema, r.uname ());
  }

  class transform_impl
  {
  public:
    transform_impl (options const& ops,
                    type_map const& tm,
                    relational::model& m,
                    diagnostics& d)
        : ops_ (ops), map_ (tm), m_ (m), diag_ (d), r_ (new target::model)
    {
    }

    unique_ptr<target::model>
    transform ();

  public:
    void
    table (relational::table&);

    void
    view (relational::view&);

  private:
    void
    entity (target::entity&, relational::nameable&, qname const&);

    target::property
    property (target::entity const&,
              relational::column&,
              name_set&,
              char const* suffix);

    void
    value_set (target::entity&, relational::table&, value_set_decl&);

    relational::column*
    value_set_column (relational::table&,
                      string const& name,
                      value_set_decl const&);

  private:
    options const& ops_;
    type_map const& map_;
    relational::model& m_;
    diagnostics& diag_;
    unique_ptr<target::model> r_;

    value_set_map value_sets_;
  };

  struct table_: traversal::relational::table
  {
    table_ (transform_impl& t): t_ (t) {}

    virtual void
    traverse (type& t)
    {
      t_.table (t);
    }

    transform_impl& t_;
  };

  struct view_: traversal::relational::view
  {
    view_ (transform_impl& t): t_ (t) {}

    virtual void
    traverse (type& v)
    {
      t_.view (v);
    }

    transform_impl& t_;
  };

  unique_ptr<target::model> transform_impl::
  transform ()
  {
    typedef vector<value_set_spec> specs;
    specs const& vs (ops_.value_set ());

    for (specs::const_iterator i (vs.begin ()); i != vs.end (); ++i)
    {
      value_set_decl d;
      d.spec = *i;
      d.table = parse_qname (i->table, ops_.default_schema ());
      d.used = false;

      if (!value_sets_.insert (make_pair (d.table.key (), d)).second)
        error (diag_, diagnostic::duplicate_definition, location ())
          << "table '" << d.table << "' is specified as a value set "
          << "more than once" << endl;
    }

    traversal::relational::model model;
    traversal::relational::names names;
    table_ t (*this);
    view_ v (*this);

    model >> names;
    names >> t;
    names >> v;

    model.traverse (m_);

    for (value_set_map::const_iterator i (value_sets_.begin ());
         i != value_sets_.end (); ++i)
    {
      if (i->second.used)
        continue;

      error (diag_, diagnostic::reference_error, location ())
        << "value set table '" << i->second.table << "' does not exist"
        << endl;
    }

    return move (r_);
  }

  void transform_impl::
  entity (target::entity& e, relational::nameable& n, qname const& qn)
  {
    e.schema = qn.qualifier ().string ();
    e.name = qn.uname ();
    e.qualified = qn.string ();
    e.class_name = context::escape (qn.uname ());
    e.schema_ns = context::escape (e.schema);
    e.loc = n.loc ();
  }

  target::property transform_impl::
  property (target::entity const& e,
            relational::column& c,
            name_set& used,
            char const* suffix)
  {
    target::property p;

    p.column = c.name ();
    p.name = unique_name (c.name (), used, suffix);
    p.ordinal = c.ordinal ();
    p.null = c.null ();
    p.primary = c.primary ();
    p.identity = c.identity ();
    p.default_ = one_line (c.default_ ());

    sql_type const& st (c.type ());

    if (st.type != sql_type::invalid)
      p.source_type = st.string ();

    type_resolution r (map_.resolve (e.schema, e.name, c.name (), st));

    p.type = r.type;
    p.unknown = r.unknown ();

    // Columns with an unparseable type declaration were already
    // reported by the ingestor.
    //
    if (st.type == sql_type::invalid && !c.type_decl ().empty ())
      p.source_type = c.type_decl ();
    else if (p.unknown)
    {
      ostream& os (warn (diag_, diagnostic::unmapped_type, c.loc ()));

      os << "no type mapping for column '" << c.name () << "' of '"
         << e.qualified << "'";

      if (!p.source_type.empty ())
        os << " with type '" << p.source_type << "'";
      else
        os << " without declared type";

      os << endl;
    }

    // Foreign key annotation. If the column is part of several foreign
    // keys, the first one is used.
    //
    for (relational::column::contained_iterator i (c.contained_begin ());
         i != c.contained_end () && !p.foreign; ++i)
    {
      relational::foreign_key* fk (
        dynamic_cast<relational::foreign_key*> (&i->key ()));

      if (fk == 0 || !fk->resolved ())
        continue;

      relational::foreign_key::columns const& rc (fk->referenced_columns ());

      for (size_t j (0); j != fk->contains_size () && j != rc.size (); ++j)
      {
        if (&fk->contains_at (j).column () == &c)
        {
          p.foreign = true;
          p.foreign_table =
            fk->referenced ().table ().qualified_name ().string ();
          p.foreign_column = rc[j];

          ostringstream os;

          if (fk->on_delete () != relational::foreign_key::no_action)
            os << " ON DELETE " << fk->on_delete ();

          if (fk->on_update () != relational::foreign_key::no_action)
            os << " ON UPDATE " << fk->on_update ();

          p.foreign_actions = os.str ();
          break;
        }
      }
    }

    return p;
  }

  void transform_impl::
  table (relational::table& t)
  {
    target::entity e;
    entity (e, t, t.qualified_name ());

    value_set_map::iterator i (value_sets_.find (t.qualified_name ().key ()));

    if (i != value_sets_.end ())
    {
      i->second.used = true;
      e.kind = target::entity::values;
      value_set (e, t, i->second);
    }
    else
    {
      e.kind = target::entity::table;

      name_set used;
      used.insert (e.class_name);

      columns cs (collect (t));

      for (columns::const_iterator i (cs.begin ()); i != cs.end (); ++i)
        e.props.push_back (property (e, **i, used, "_"));
    }

    r_->ents.push_back (e);
  }

  void transform_impl::
  view (relational::view& v)
  {
    target::entity e;
    entity (e, v, v.qualified_name ());
    e.kind = target::entity::view;

    name_set used;
    used.insert (e.class_name);

    columns cs (collect (v));

    for (columns::const_iterator i (cs.begin ()); i != cs.end (); ++i)
      e.props.push_back (property (e, **i, used, "_"));

    r_->ents.push_back (e);
  }

  relational::column* transform_impl::
  value_set_column (relational::table& t,
                    string const& name,
                    value_set_decl const& d)
  {
    relational::column* c (t.find<relational::column> (name));

    if (c == 0)
      error (diag_, diagnostic::reference_error, t.loc ())
        << "column '" << name << "' specified in value set '"
        << d.spec << "' does not exist in table '" << d.table << "'"
        << endl;

    return c;
  }

  // Members generated for every value set. The value and attribute
  // names may not clash with them.
  //
  char const* value_set_members[] =
  {
    "value",
    "display",
    "index",
    "index_type",
    "count",
    "find",
    "parse",
    "try_parse",
    "all_values",
    "match",
    "i_",
    "value_data_",
    "display_data_"
  };

  literal const&
  row_value (relational::table::row const& r, size_t i)
  {
    static literal const null;
    return i < r.size () ? r[i] : null;
  }

  void transform_impl::
  value_set (target::entity& e, relational::table& t, value_set_decl& d)
  {
    columns cs (collect (t));

    if (cs.empty ())
      return;

    relational::column* vc (0);

    if (!d.spec.value.empty ())
    {
      if ((vc = value_set_column (t, d.spec.value, d)) == 0)
        return;
    }
    else
    {
      relational::primary_key* pk (t.primary ());

      vc = pk != 0 && pk->contains_size () == 1
        ? &pk->contains_at (0).column ()
        : cs.front ();
    }

    relational::column* dc (vc);

    if (!d.spec.display.empty ())
    {
      if ((dc = value_set_column (t, d.spec.display, d)) == 0)
        return;
    }

    target::value_set& s (e.set);
    s.value_column = vc->name ();
    s.display_column = dc->name ();

    name_set used (
      value_set_members,
      value_set_members + sizeof (value_set_members) / sizeof (char const*));
    used.insert (e.class_name);

    // Extra attributes.
    //
    vector<size_t> ords;

    for (columns::const_iterator i (cs.begin ()); i != cs.end (); ++i)
    {
      relational::column& c (**i);

      if (&c == vc || &c == dc)
        continue;

      s.attrs.push_back (property (e, c, used, "_data_"));
      ords.push_back (c.ordinal ());
    }

    // Entries.
    //
    relational::table::rows_type const& rows (t.rows ());

    if (rows.empty ())
    {
      error (diag_, diagnostic::constraint_error, t.loc ())
        << "value set table '" << e.qualified << "' has no rows" << endl;
      return;
    }

    typedef map<string, location> value_map;
    value_map seen;

    for (relational::table::rows_type::const_iterator i (rows.begin ());
         i != rows.end (); ++i)
    {
      literal const& v (row_value (*i, vc->ordinal ()));
      location const& l (v.loc.file.empty () ? t.loc () : v.loc);

      if (v.null ())
      {
        error (diag_, diagnostic::constraint_error, l)
          << "NULL value in column '" << vc->name () << "' of value set "
          << "table '" << e.qualified << "'" << endl;
        continue;
      }

      pair<value_map::iterator, bool> r (
        seen.insert (make_pair (v.value, l)));

      if (!r.second)
      {
        error (diag_, diagnostic::duplicate_definition, l)
          << "duplicate value '" << v.value << "' in value set table '"
          << e.qualified << "'" << endl;

        info (diag_, diagnostic::duplicate_definition, r.first->second)
          << "value '" << v.value << "' is first inserted here" << endl;
        continue;
      }

      target::entry en;
      en.value = v.value;

      literal const& dv (row_value (*i, dc->ordinal ()));
      en.display = dv.null () ? v.value : dv.value;
      en.name = unique_name (v.value, used);

      for (vector<size_t>::const_iterator j (ords.begin ());
           j != ords.end (); ++j)
        en.attributes.push_back (row_value (*i, *j));

      s.values.push_back (en);
    }
  }
}

transformer::
transformer (options const& ops, type_map const& tm)
    : ops_ (ops), map_ (tm)
{
}

unique_ptr<target::model> transformer::
transform (relational::model& m, diagnostics& d) const
{
  diagnostics ld;
  transform_impl impl (ops_, map_, m, ld);
  unique_ptr<target::model> r (impl.transform ());

  d.append (ld);

  if (ld.fatal ())
    r.reset ();

  return r;
}
