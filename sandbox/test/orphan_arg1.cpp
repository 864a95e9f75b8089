#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// Leaves behind a child that creates the file argv[1] after half a second,
// then sleeps for a long time.
int main(int argc, char** argv) {
  if (fork() == 0) {
    usleep(500 * 1000);
    int fd = open(argv[1], O_WRONLY | O_CREAT, S_IRUSR | S_IWUSR);
    if (fd != -1) close(fd);
    return 0;
  }
  sleep(10);
  return 0;
}
