// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "contract.hpp"
#include "moveprocessor.hpp"
#include "sqlitequizstorage.hpp"
#include "statejson.hpp"
#include "storage.hpp"

#include "quizutil/jsonutils.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace
{

DEFINE_string (storage_type, "sqlite",
               "the storage to use for the quiz state ('sqlite' or 'memory')");
DEFINE_string (datadir, "",
               "the SQLite database file holding the quiz state");

DEFINE_string (educators, "",
               "comma-separated list of the initial educators, used"
               " when creating the quiz");
DEFINE_int32 (min_answer_length, 0,
              "if positive, answers of new questions must have at least"
              " that many bytes");

DEFINE_string (moves_file, "",
               "file with a JSON array of moves for 'apply'"
               " (if empty, they are read from stdin)");

/**
 * Splits the comma-separated list of educators from the flag.
 * Empty entries are skipped.
 */
std::set<std::string>
ParseEducators (const std::string& lst)
{
  std::set<std::string> res;

  std::istringstream in(lst);
  std::string cur;
  while (std::getline (in, cur, ','))
    if (!cur.empty ())
      res.insert (cur);

  return res;
}

/**
 * Reads the moves to apply from the file given by --moves_file or from
 * stdin.  Returns false if they cannot be read or parsed.
 */
bool
ReadMoves (Json::Value& moves)
{
  std::string data;
  if (FLAGS_moves_file.empty ())
    data.assign (std::istreambuf_iterator<char> (std::cin),
                 std::istreambuf_iterator<char> ());
  else
    {
      std::ifstream in(FLAGS_moves_file);
      if (!in)
        {
          LOG (ERROR) << "Failed to open moves file " << FLAGS_moves_file;
          return false;
        }
      data.assign (std::istreambuf_iterator<char> (in),
                   std::istreambuf_iterator<char> ());
    }

  if (!quiz::ParseJsonString (data, moves) || !moves.isArray ())
    {
      LOG (ERROR) << "The moves must be given as JSON array";
      return false;
    }

  return true;
}

/**
 * Parses a question ID given on the command line.
 */
bool
ParseQuestionId (const std::string& str, quiz::QuestionId& id)
{
  Json::Value val;
  if (!quiz::ParseJsonString (str, val))
    return false;
  return quiz::QuestionIdFromJson (val, id);
}

void
PrintJson (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["indentation"] = "  ";
  std::cout << Json::writeString (wbuilder, val) << std::endl;
}

/**
 * Runs the given command (with its arguments) against the contract.
 * Returns the process exit code.
 */
int
RunCommand (quiz::QuizContract& contract, const std::vector<std::string>& cmd)
{
  const std::string& name = cmd.front ();
  const size_t numArgs = cmd.size () - 1;

  if (name == "init")
    {
      if (numArgs != 0)
        {
          std::cerr << "Usage: init" << std::endl;
          return EXIT_FAILURE;
        }

      const auto err = contract.Initialise (ParseEducators (FLAGS_educators));
      if (err != quiz::Error::OK)
        {
          std::cerr << "Error: creating the quiz failed: " << err
                    << std::endl;
          return EXIT_FAILURE;
        }

      return EXIT_SUCCESS;
    }

  if (!contract.IsInitialised ())
    {
      std::cerr << "Error: the quiz has not been created yet" << std::endl;
      return EXIT_FAILURE;
    }

  const quiz::StateJsonExtractor ext(contract);

  if (name == "apply")
    {
      Json::Value moves;
      if (numArgs != 0 || !ReadMoves (moves))
        {
          std::cerr << "Usage: apply (with the moves as JSON array)"
                    << std::endl;
          return EXIT_FAILURE;
        }

      quiz::MoveProcessor proc(contract);
      proc.ProcessAll (moves);

      PrintJson (ext.HashState ().ToHex ());
      return EXIT_SUCCESS;
    }

  if (name == "list" && numArgs == 0)
    {
      PrintJson (ext.ListQuestions ());
      return EXIT_SUCCESS;
    }

  if (name == "question" && numArgs == 1)
    {
      quiz::QuestionId id;
      if (!ParseQuestionId (cmd[1], id))
        {
          std::cerr << "Error: invalid question ID: " << cmd[1] << std::endl;
          return EXIT_FAILURE;
        }

      const Json::Value res = ext.GetQuestion (id);
      PrintJson (res);
      return res.isNull () ? EXIT_FAILURE : EXIT_SUCCESS;
    }

  if (name == "check" && numArgs == 2)
    {
      quiz::QuestionId id;
      if (!ParseQuestionId (cmd[1], id))
        {
          std::cerr << "Error: invalid question ID: " << cmd[1] << std::endl;
          return EXIT_FAILURE;
        }

      const Json::Value res = ext.CheckAnswer (id, cmd[2]);
      PrintJson (res);
      return res.isMember ("error") ? EXIT_FAILURE : EXIT_SUCCESS;
    }

  if (name == "role" && numArgs == 1)
    {
      PrintJson (ext.GetPowerLevel (cmd[1]));
      return EXIT_SUCCESS;
    }

  if (name == "state" && numArgs == 0)
    {
      PrintJson (ext.FullState ());
      return EXIT_SUCCESS;
    }

  if (name == "hash" && numArgs == 0)
    {
      PrintJson (ext.HashState ().ToHex ());
      return EXIT_SUCCESS;
    }

  std::cerr << "Error: invalid command or arguments: " << name << std::endl;
  return EXIT_FAILURE;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("quizd [flags] COMMAND [ARGS]\n"
                           "Commands: init, apply, list, question ID,"
                           " check ID ANSWER, role NAME, state, hash");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (argc < 2)
    {
      std::cerr << "Error: no command given" << std::endl;
      return EXIT_FAILURE;
    }
  if (FLAGS_min_answer_length < 0)
    {
      std::cerr << "Error: --min_answer_length must not be negative"
                << std::endl;
      return EXIT_FAILURE;
    }

  std::unique_ptr<quiz::QuizStorage> storage;
  if (FLAGS_storage_type == "memory")
    storage = std::make_unique<quiz::MemoryQuizStorage> ();
  else if (FLAGS_storage_type == "sqlite")
    {
      if (FLAGS_datadir.empty ())
        {
          std::cerr << "Error: --datadir must be specified" << std::endl;
          return EXIT_FAILURE;
        }
      storage = std::make_unique<quiz::SQLiteQuizStorage> (FLAGS_datadir);
    }
  else
    {
      std::cerr << "Error: invalid --storage_type: " << FLAGS_storage_type
                << std::endl;
      return EXIT_FAILURE;
    }
  storage->Initialise ();

  quiz::ContractConfig config;
  config.MinAnswerLength = FLAGS_min_answer_length;
  quiz::QuizContract contract(*storage, config);

  /* The in-memory state does not survive between runs, so it is a dry run
     that creates the quiz right away from --educators.  */
  const std::vector<std::string> cmd(argv + 1, argv + argc);
  if (FLAGS_storage_type == "memory" && cmd.front () != "init")
    {
      const auto err = contract.Initialise (ParseEducators (FLAGS_educators));
      if (err != quiz::Error::OK)
        {
          std::cerr << "Error: creating the quiz failed: " << err
                    << std::endl;
          return EXIT_FAILURE;
        }
    }

  return RunCommand (contract, cmd);
}
