// file      : sqlgen/parallel.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_PARALLEL_HXX
#define SQLGEN_PARALLEL_HXX

#include <atomic>
#include <thread>
#include <vector>
#include <cstddef>   // std::size_t
#include <exception> // std::exception_ptr

// Number of threads to use for n tasks given the --jobs value (0 means
// the hardware concurrency).
//
inline std::size_t
job_count (std::size_t jobs, std::size_t n)
{
  if (jobs == 0)
  {
    jobs = std::thread::hardware_concurrency ();

    if (jobs == 0)
      jobs = 1;
  }

  return jobs < n ? jobs : n;
}

// Call f(i) for each i in [0, n) using up to the specified number of
// threads. All the threads are joined before returning. If any call
// throws, then the first exception (in task order) is rethrown.
//
template <typename F>
void
run_parallel (std::size_t n, std::size_t jobs, F f)
{
  std::size_t t (job_count (jobs, n));

  if (t <= 1)
  {
    for (std::size_t i (0); i != n; ++i)
      f (i);

    return;
  }

  std::atomic<std::size_t> next (0);
  std::vector<std::exception_ptr> errors (n);
  std::vector<std::thread> threads;

  for (std::size_t j (0); j != t; ++j)
  {
    threads.push_back (
      std::thread (
        [&f, &next, &errors, n] ()
        {
          for (std::size_t i; (i = next++) < n; )
          {
            try
            {
              f (i);
            }
            catch (...)
            {
              errors[i] = std::current_exception ();
            }
          }
        }));
  }

  for (std::size_t j (0); j != t; ++j)
    threads[j].join ();

  for (std::size_t i (0); i != n; ++i)
  {
    if (errors[i])
      std::rethrow_exception (errors[i]);
  }
}

#endif // SQLGEN_PARALLEL_HXX
