#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <ctime>

// Runs argv[1] children one after the other, each burning 0.3 seconds of CPU
// time, and reaps them.
int main(int argc, char** argv) {
  int count = atoi(argv[1]);
  for (int i = 0; i < count; i++) {
    pid_t pid = fork();
    if (pid == -1) return 1;
    if (pid == 0) {
      std::clock_t start = std::clock();
      volatile unsigned long x = 0;
      while (std::clock() - start < 0.3 * CLOCKS_PER_SEC) x++;
      _exit(0);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) != pid) return 1;
  }
  return 0;
}
