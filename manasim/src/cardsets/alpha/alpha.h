// alpha.h
#pragma once

#include "rules/card.h"

Card lightningBolt();
Card counterspell();
Card giantGrowth();
Card healingSalve();
Card ancestralRecall();
Card terror();
Card unsummon();

Card llanowarElves();
Card grizzlyBears();
Card grayOgre();
Card hillGiant();
Card crawWurm();
Card giantSpider();
Card serraAngel();
Card sengirVampire();
Card shivanDragon();
Card whiteKnight();
Card blackKnight();
Card venerableMonk();
Card prodigalSorcerer();

void registerAlpha();
