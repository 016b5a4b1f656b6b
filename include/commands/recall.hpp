#pragma once

int cmd_recall(int argc, char** argv);
