#include <hltb/match/match-name.hxx>

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace hltb;

// Marks and typographic punctuation.
//
static void
test_sanitize ()
{
  assert (sanitize_name ("Dark Souls™: Prepare to Die Edition") ==
          "Dark Souls: Prepare to Die Edition");

  assert (sanitize_name ("Tom Clancy’s Rainbow Six® Siege") ==
          "Tom Clancy's Rainbow Six Siege");

  assert (sanitize_name ("Half-Life — Source") == "Half-Life - Source");
  assert (sanitize_name ("  Portal   2 ") == "Portal 2");
  assert (sanitize_name ("DOOM ™ : Eternal") == "DOOM: Eternal");
  assert (sanitize_name ("*NEW* Game~") == "NEW Game");

  // Nothing to do.
  //
  assert (sanitize_name ("Celeste") == "Celeste");
  assert (sanitize_name ("") == "");

  // Non-ASCII we don't know about is left alone.
  //
  assert (sanitize_name ("Pokémon") == "Pokémon");
}

// Edition and suffix qualifiers.
//
static void
test_simplify ()
{
  assert (simplify_name ("Dark Souls: Prepare to Die Edition") == "Dark Souls");
  assert (simplify_name ("The Elder Scrolls V: Skyrim Special Edition") ==
          "The Elder Scrolls V: Skyrim");
  assert (simplify_name ("The Witcher 3: Wild Hunt - Game of the Year Edition") ==
          "The Witcher 3: Wild Hunt");
  assert (simplify_name ("Divinity: Original Sin (Classic)") ==
          "Divinity: Original Sin");
  assert (simplify_name ("Tomb Raider (2013)") == "Tomb Raider");
  assert (simplify_name ("Mafia II: Definitive Edition") == "Mafia II");
  assert (simplify_name ("Spyro Reignited Trilogy") == "Spyro Reignited Trilogy");
  assert (simplify_name ("Shadow of the Colossus HD") == "Shadow of the Colossus");
  assert (simplify_name ("BioShock Remastered") == "BioShock");

  // Stacked qualifiers.
  //
  assert (simplify_name ("Okami HD (2017)") == "Okami");

  // The article belongs to the edition.
  //
  assert (simplify_name ("Tomb Raider: The Definitive Edition") ==
          "Tomb Raider");
  assert (simplify_name ("Grand Theft Auto: Vice City - The Definitive Edition") ==
          "Grand Theft Auto: Vice City");

  // A hyphen inside a word is part of the title.
  //
  assert (simplify_name ("Spider-Man Uncaged Edition") ==
          "Spider-Man Uncaged Edition");
  assert (simplify_name ("Spider-Man: Miles Morales") ==
          "Spider-Man: Miles Morales");
  assert (simplify_name ("Half-Life 2 - Uncut Edition") == "Half-Life 2");
  assert (simplify_name ("Spider-Man Remastered") == "Spider-Man");

  // Only the last clause goes.
  //
  assert (simplify_name ("Yakuza: Like a Dragon - Hero Edition") ==
          "Yakuza: Like a Dragon");

  {
    name_query q ("Spider-Man Uncaged Edition");
    assert (q.plan ().size () == 1);
  }

  // Never empty.
  //
  assert (simplify_name ("(2013)") == "(2013)");
  assert (simplify_name ("Edition") == "Edition");
}

// Simplify only ever removes.
//
static void
test_simplify_shrinks ()
{
  const vector<string> names {
    "Dark Souls™: Prepare to Die Edition",
    "Final Fantasy Tactics: The Ivalice Chronicles",
    "Half-Life 2",
    "HD",
    "Remastered",
    "Grand Theft Auto V (2015) - Premium Edition",
    "   ",
    "The Last of Us™ Part I",
    "Yakuza 0 Director's Cut"};

  for (const string& n: names)
  {
    string s (sanitize_name (n));
    assert (simplify_name (s).size () <= s.size ());
  }
}

static void
test_edit_distance ()
{
  assert (edit_distance ("", "") == 0);
  assert (edit_distance ("abc", "") == 3);
  assert (edit_distance ("", "abc") == 3);
  assert (edit_distance ("kitten", "sitting") == 3);
  assert (edit_distance ("flaw", "lawn") == 2);

  // Case does not count.
  //
  assert (edit_distance ("DOOM", "doom") == 0);
  assert (edit_distance ("Half-Life", "half-life 2") == 2);

  // Identity.
  //
  for (const char* s: {"a", "Dark Souls", "Stardew Valley", "x y z"})
    assert (edit_distance (s, s) == 0);

  // Symmetry.
  //
  assert (edit_distance ("Portal", "Portal 2") ==
          edit_distance ("Portal 2", "Portal"));
}

static void
test_threshold ()
{
  assert (match_threshold ("a", "b") == 5);
  assert (match_threshold ("Dark Souls", "Dark Souls II") == 5);

  // 20% of 30 characters.
  //
  string l (30, 'x');
  assert (match_threshold (l, "short") == 6);
  assert (match_threshold ("short", l) == 6);

  // Rounded down.
  //
  assert (match_threshold (string (34, 'x'), "") == 6);
}

static void
test_query ()
{
  name_query q ("Dark Souls™: Prepare to Die Edition");

  assert (q.sanitized == "Dark Souls: Prepare to Die Edition");
  assert (q.simplified == "Dark Souls");

  vector<string> p (q.plan ());
  assert (p.size () == 2);
  assert (p[0] == q.sanitized);
  assert (p[1] == q.simplified);

  // Nothing to simplify, a single query.
  //
  name_query s ("Celeste");
  assert (s.plan ().size () == 1);
}

int
main ()
{
  test_sanitize ();
  test_simplify ();
  test_simplify_shrinks ();
  test_edit_distance ();
  test_threshold ();
  test_query ();
}
