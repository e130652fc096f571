#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

int main(int argc, char** argv) {
  int sig = atoi(argv[1]);
  signal(sig, SIG_DFL);
  kill(getpid(), sig);
  return 0;
}
