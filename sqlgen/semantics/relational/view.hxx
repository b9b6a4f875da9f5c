// file      : sqlgen/semantics/relational/view.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_VIEW_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_VIEW_HXX

#include <sqlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    // The query is carried through verbatim. The view's scope contains
    // only the explicitly declared columns.
    //
    class view: public nameable, public scope
    {
    public:
      qname const&
      qualified_name () const
      {
        return qname_;
      }

      string const&
      query () const
      {
        return query_;
      }

    public:
      view (location const& l, qname const& n, string const& query)
          : nameable (l), qname_ (n), query_ (query)
      {
      }

      virtual string
      kind () const {return "view";}

      // Resolve ambiguity.
      //
      using nameable::scope;

    private:
      qname qname_;
      string query_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_VIEW_HXX
