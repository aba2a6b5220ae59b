#include <fdguard.h>

#include <gpxstat_annotations.h>

#include <cassert>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

void check_guard(int openfd, int &rootfdnum, const char *exe)
{
  fdguard infd(0);
  assert(infd);

  fdguard ofd(openfd);
  fdguard rootfd("/", O_RDONLY);

  rootfdnum = rootfd;

  assert(ofd.valid());
  assert(ofd);
  assert_cmpnum_op(static_cast<int>(ofd), >, 0);
  assert_cmpnum(static_cast<int>(ofd), openfd);
  assert(rootfd.valid());
  assert(rootfd);
  assert_cmpnum_op(static_cast<int>(rootfd), >, 0);

  rootfd.swap(ofd);

  assert_cmpnum(static_cast<int>(rootfd), openfd);
  assert_cmpnum(static_cast<int>(ofd), rootfdnum);

  fdguard file(exe, O_RDONLY);
  assert(file.valid());

  // descriptors are not inherited by child processes
  assert_cmpnum_op(fcntl(file, F_GETFD) & FD_CLOEXEC, !=, 0);
}

void check_invalid(const std::string &exepath)
{
  fdguard invalid(-1);
  assert(!invalid.valid());
  assert(!invalid);

  fdguard missing((exepath + "/does_not_exist.gpx").c_str(), O_RDONLY);
  assert(!missing.valid());
  assert(!missing);

  // moving an invalid guard keeps it invalid
  fdguard moved(std::move(missing));
  assert(!moved.valid());
}

// test move constructor
void check_constructors(const char *exe)
{
  fdguard exe1(exe, O_RDONLY);
  assert(exe1.valid());

  assert_cmpnum(static_cast<int>(lseek(exe1.fd, 1024, SEEK_SET)), 1024);

  // moving the descriptor should keep the offset
  const int num = exe1.fd;
  fdguard exe2(std::move(exe1));
  assert(!exe1.valid());
  assert_cmpnum(exe2.fd, num);
  assert_cmpnum(static_cast<int>(lseek(exe2.fd, 0, SEEK_CUR)), 1024);

  std::vector<fdguard> vec;
  vec.emplace_back(std::move(exe2));

  assert_cmpnum(static_cast<int>(lseek(vec.front().fd, 0, SEEK_CUR)), 1024);
}

} // namespace

int main(int argc, char **argv)
{
  assert_cmpnum(argc, 2);

  int openfd = dup(1);
  int rootfd = -1;

  assert_cmpnum_op(openfd, >, 0);

  std::string exepath(argv[1]);
  std::string::size_type slpos = exepath.rfind('/');
  exepath.erase(slpos);

  check_constructors(argv[1]);
  check_guard(openfd, rootfd, argv[1]);
  check_invalid(exepath);

  assert_cmpnum_op(rootfd, >, 0);

  struct stat st;

  // the descriptors should be closed now, so fstat() should fail
  assert_cmpnum(fstat(openfd, &st), -1);
  assert_cmpnum(fstat(rootfd, &st), -1);

  return 0;
}
