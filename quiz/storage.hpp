// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_STORAGE_HPP
#define QUIZ_STORAGE_HPP

#include "powerlevel.hpp"
#include "question.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quiz
{

/**
 * Interface for the key-value store that holds the persisted state of
 * a quiz:  the role of each identity, the sequence of questions and
 * whether or not the quiz has been initialised.
 *
 * All modifications are done while a transaction is active, and a
 * transaction is never nested into another one.
 */
class QuizStorage
{

public:

  virtual ~QuizStorage () = default;

  /**
   * Called before the storage is used.  This can be used to open
   * external resources if necessary.
   */
  virtual void Initialise ();

  /**
   * Returns true if the quiz has been created with its initial
   * educators already.
   */
  virtual bool IsInitialised () const = 0;

  /**
   * Marks the quiz as initialised.
   */
  virtual void MarkInitialised () = 0;

  /**
   * Looks up the power level of the given identity.  Returns UNREGISTERED
   * for identities without an explicit role.
   */
  virtual PowerLevel GetPowerLevel (const std::string& name) const = 0;

  /**
   * Sets the role of the given identity, replacing any previous one.
   * The level must not be UNREGISTERED (roles are never removed).
   */
  virtual void SetPowerLevel (const std::string& name, PowerLevel l) = 0;

  /**
   * Returns all identities with an explicit role.
   */
  virtual std::map<std::string, PowerLevel> GetAllRoles () const = 0;

  /**
   * Returns the number of questions, which is also the ID that the
   * next question will get.
   */
  virtual QuestionId GetNumQuestions () const = 0;

  /**
   * Appends a question.  Its ID must be equal to GetNumQuestions.
   */
  virtual void AppendQuestion (const Question& q) = 0;

  /**
   * Retrieves the question with the given ID.  Returns false if there
   * is none.
   */
  virtual bool GetQuestion (QuestionId id, Question& q) const = 0;

  /**
   * Returns all questions ordered by their ID.
   */
  virtual std::vector<Question> GetAllQuestions () const = 0;

  /**
   * Starts a transaction.  All changes made until the matching call
   * to CommitTransaction or RollbackTransaction are applied or reverted
   * together.
   */
  virtual void BeginTransaction () = 0;
  virtual void CommitTransaction () = 0;
  virtual void RollbackTransaction () = 0;

};

/**
 * Helper class that starts a transaction on a storage and either commits
 * or rolls it back later based on RAII semantics.
 */
class ActiveTransaction
{

private:

  /** The storage on which the transaction is active.  */
  QuizStorage& storage;

  /**
   * Whether the operation was successful.  If this is set to true at some
   * point in time, then CommitTransaction will be called.  Otherwise, the
   * transaction is rolled back in the destructor.
   */
  bool success = false;

public:

  explicit ActiveTransaction (QuizStorage& s);
  ~ActiveTransaction ();

  ActiveTransaction () = delete;
  ActiveTransaction (const ActiveTransaction&) = delete;
  void operator= (const ActiveTransaction&) = delete;

  void
  SetSuccess ()
  {
    success = true;
  }

};

/**
 * An implementation of QuizStorage that holds all data just in memory.
 * The state is lost when the process exits, which is fine for tests
 * and dry runs of moves.
 */
class MemoryQuizStorage : public QuizStorage
{

private:

  /**
   * All the data that makes up the state.  This is grouped together
   * so that a transaction can simply keep a copy to roll back to.
   */
  struct Data
  {
    bool initialised = false;
    std::map<std::string, PowerLevel> roles;
    std::vector<Question> questions;
  };

  /** The current state.  */
  Data current;

  /**
   * The state as of the start of the current transaction.  It is null
   * if no transaction is active.
   */
  std::unique_ptr<Data> backup;

public:

  MemoryQuizStorage () = default;

  MemoryQuizStorage (const MemoryQuizStorage&) = delete;
  void operator= (const MemoryQuizStorage&) = delete;

  bool IsInitialised () const override;
  void MarkInitialised () override;

  PowerLevel GetPowerLevel (const std::string& name) const override;
  void SetPowerLevel (const std::string& name, PowerLevel l) override;
  std::map<std::string, PowerLevel> GetAllRoles () const override;

  QuestionId GetNumQuestions () const override;
  void AppendQuestion (const Question& q) override;
  bool GetQuestion (QuestionId id, Question& q) const override;
  std::vector<Question> GetAllQuestions () const override;

  void BeginTransaction () override;
  void CommitTransaction () override;
  void RollbackTransaction () override;

};

} // namespace quiz

#endif // QUIZ_STORAGE_HPP
